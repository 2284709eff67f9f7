#include <common/settings_store.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>

namespace cs {
    namespace fs = std::filesystem;

    YamlSettingsStore::YamlSettingsStore(fs::path path)
        : path_(path.empty() ? default_path() : std::move(path)) {}

    fs::path YamlSettingsStore::default_path() {
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
            if (*xdg) return fs::path(xdg) / "camswitch" / "defaults.yaml";
        }
        if (const char* home = std::getenv("HOME")) {
            return fs::path(home) / ".config" / "camswitch" / "defaults.yaml";
        }
        return fs::temp_directory_path() / "camswitch" / "defaults.yaml";
    }

    Settings YamlSettingsStore::load() {
        Settings s;
        std::error_code ec;
        if (!fs::exists(path_, ec)) return s;

        YAML::Node root;
        try {
            root = YAML::LoadFile(path_.string());
        } catch (const YAML::Exception& e) {
            std::cerr << "[Settings](load) ignoring unreadable " << path_ << ": " << e.what() << "\n";
            return s;
        }
        if (!root || !root.IsMap()) return s;

        // entries that fail to convert are dropped one by one, the rest still loads
        auto str = [&](const char* key, std::string& out) {
            try {
                if (root[key]) out = root[key].as<std::string>();
            } catch (const YAML::Exception& e) {
                std::cerr << "[Settings](load) bad " << key << ": " << e.what() << "\n";
            }
        };
        str("camera_a", s.camera_a);
        str("camera_b", s.camera_b);
        str("virtual_output", s.virtual_output);

        std::string active;
        str("last_active", active);
        SourceSlot slot;
        if (!active.empty()) {
            if (parse_slot(active, slot)) s.last_active = slot;
            else std::cerr << "[Settings](load) ignoring last_active=" << active << "\n";
        }

        try {
            if (root["preview"]) s.preview_enabled = root["preview"].as<bool>();
        } catch (const YAML::Exception& e) {
            std::cerr << "[Settings](load) bad preview: " << e.what() << "\n";
        }
        return s;
    }

    bool YamlSettingsStore::store(const Settings& s) {
        std::error_code ec;
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            std::cerr << "[Settings](store) cannot create " << path_.parent_path() << ": " << ec.message() << "\n";
            return false;
        }

        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "camera_a" << YAML::Value << s.camera_a;
        out << YAML::Key << "camera_b" << YAML::Value << s.camera_b;
        out << YAML::Key << "virtual_output" << YAML::Value << s.virtual_output;
        if (s.last_active) out << YAML::Key << "last_active" << YAML::Value << to_string(*s.last_active);
        if (s.preview_enabled) out << YAML::Key << "preview" << YAML::Value << *s.preview_enabled;
        out << YAML::EndMap;

        const fs::path tmp = path_.string() + ".tmp";
        {
            std::ofstream f(tmp, std::ios::trunc);
            if (!f.is_open()) {
                std::cerr << "[Settings](store) unable to write " << tmp << "\n";
                return false;
            }
            f << out.c_str() << "\n";
            if (!f.good()) {
                std::cerr << "[Settings](store) write failed for " << tmp << "\n";
                return false;
            }
        }

        fs::rename(tmp, path_, ec);
        if (ec) {
            std::cerr << "[Settings](store) rename to " << path_ << " failed: " << ec.message() << "\n";
            fs::remove(tmp, ec);
            return false;
        }
        return true;
    }

    bool YamlSettingsStore::clear() {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            std::cerr << "[Settings](clear) " << path_ << ": " << ec.message() << "\n";
            return false;
        }
        return true;
    }
}
