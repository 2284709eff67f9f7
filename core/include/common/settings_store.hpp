#pragma once

#include <pipeline/types.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace cs {
    struct Settings {
        DeviceId camera_a;
        DeviceId camera_b;
        DeviceId virtual_output;
        std::optional<SourceSlot> last_active;
        std::optional<bool> preview_enabled;
    };

    // Boundary to whatever persists the user's choices.
    class ISettingsStore {
    public:
        virtual ~ISettingsStore() = default;
        virtual Settings load() = 0;
        virtual bool store(const Settings& s) = 0;
        virtual bool clear() = 0;
    };

    class YamlSettingsStore : public ISettingsStore {
    public:
        explicit YamlSettingsStore(std::filesystem::path path);

        // $XDG_CONFIG_HOME/camswitch/defaults.yaml, else ~/.config/camswitch/defaults.yaml
        static std::filesystem::path default_path();

        Settings load() override;
        bool store(const Settings& s) override;
        bool clear() override;

        const std::filesystem::path& path() const { return path_; }
    private:
        std::filesystem::path path_;
    };
}
