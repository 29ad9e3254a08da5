#include "client/prefs_store.hpp"
#include "common/logger.hpp"

#include <boost/json.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <sstream>

#ifndef _WIN32
#include <unistd.h>
#include <pwd.h>
#endif

namespace json = boost::json;

namespace riglink::client {

namespace {
auto& log() { return Logger::get("client.prefs"); }

void read_string(const json::object& obj, std::string_view key, std::string& out) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string()) {
        out = std::string(it->value().as_string());
    }
}

void read_bool(const json::object& obj, std::string_view key, bool& out) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool()) {
        out = it->value().as_bool();
    }
}
} // anonymous namespace

PrefsStore::PrefsStore(const std::filesystem::path& state_dir)
    : prefs_path_(state_dir / "prefs.json") {
}

bool PrefsStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(prefs_path_, ec);
}

bool PrefsStore::ensure_directory() {
    try {
        auto dir = prefs_path_.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
            log().debug("Created state directory: {}", dir.string());
        }
        return true;
    } catch (const std::exception& e) {
        last_error_ = std::string("Failed to create directory: ") + e.what();
        log().error("{}", last_error_);
        return false;
    }
}

bool PrefsStore::load() {
    std::lock_guard lock(mutex_);

    if (!exists()) {
        log().debug("Prefs file not found, using defaults: {}", prefs_path_.string());
        return true;
    }

    try {
        std::ifstream ifs(prefs_path_);
        if (!ifs) {
            last_error_ = "Failed to open prefs file";
            log().error("{}: {}", last_error_, prefs_path_.string());
            return false;
        }

        std::stringstream buffer;
        buffer << ifs.rdbuf();
        auto jv = json::parse(buffer.str());
        if (!jv.is_object()) {
            last_error_ = "Prefs root must be an object";
            log().error("{}", last_error_);
            return false;
        }
        auto& root = jv.as_object();

        ConnectionPreferences loaded;

        // connection section
        if (auto it = root.find("connection"); it != root.end() && it->value().is_object()) {
            auto& conn = it->value().as_object();
            read_bool(conn, "gui_enabled", loaded.gui_enabled);
            read_string(conn, "client_id", loaded.client_id);
            read_string(conn, "default_gui", loaded.default_gui_connection);
            read_string(conn, "default_non_gui", loaded.default_non_gui_connection);
            read_bool(conn, "connect_to_first", loaded.connect_to_first);
        }

        // relay section
        if (auto it = root.find("relay"); it != root.end() && it->value().is_object()) {
            auto& relay = it->value().as_object();
            read_bool(relay, "enabled", loaded.relay_enabled);
            read_string(relay, "email", loaded.relay_email);
            read_string(relay, "name", loaded.relay_name);
            read_string(relay, "callsign", loaded.relay_callsign);
        }

        prefs_ = std::move(loaded);
        log().info("Loaded prefs from: {}", prefs_path_.string());
        return true;
    } catch (const boost::system::system_error& e) {
        last_error_ = std::string("JSON parse error: ") + e.what();
        log().error("{}", last_error_);
        return false;
    } catch (const std::exception& e) {
        last_error_ = std::string("Failed to load prefs: ") + e.what();
        log().error("{}", last_error_);
        return false;
    }
}

std::string PrefsStore::generate_json() const {
    json::object root;

    json::object conn;
    conn["gui_enabled"] = prefs_.gui_enabled;
    if (!prefs_.client_id.empty())
        conn["client_id"] = prefs_.client_id;
    if (!prefs_.default_gui_connection.empty())
        conn["default_gui"] = prefs_.default_gui_connection;
    if (!prefs_.default_non_gui_connection.empty())
        conn["default_non_gui"] = prefs_.default_non_gui_connection;
    conn["connect_to_first"] = prefs_.connect_to_first;
    root["connection"] = std::move(conn);

    json::object relay;
    relay["enabled"] = prefs_.relay_enabled;
    if (!prefs_.relay_email.empty())
        relay["email"] = prefs_.relay_email;
    if (!prefs_.relay_name.empty())
        relay["name"] = prefs_.relay_name;
    if (!prefs_.relay_callsign.empty())
        relay["callsign"] = prefs_.relay_callsign;
    root["relay"] = std::move(relay);

    return json::serialize(root);
}

bool PrefsStore::save() {
    std::lock_guard lock(mutex_);

    if (!ensure_directory()) {
        return false;
    }

    try {
        // 先写入临时文件，再原子重命名
        auto temp_path = prefs_path_;
        temp_path += ".tmp";

        {
            std::ofstream ofs(temp_path);
            if (!ofs) {
                last_error_ = "Failed to open temp file for writing";
                log().error("{}: {}", last_error_, temp_path.string());
                return false;
            }
            ofs << generate_json();
        }

        std::filesystem::rename(temp_path, prefs_path_);

        log().debug("Saved prefs to: {}", prefs_path_.string());
        return true;
    } catch (const std::exception& e) {
        last_error_ = std::string("Failed to save prefs: ") + e.what();
        log().error("{}", last_error_);
        return false;
    }
}

ConnectionPreferences PrefsStore::snapshot() const {
    std::lock_guard lock(mutex_);
    return prefs_;
}

// ========== Connection ==========

void PrefsStore::set_gui_enabled(bool value) {
    std::lock_guard lock(mutex_);
    prefs_.gui_enabled = value;
}

void PrefsStore::set_default_connection(bool gui, const std::string& connection) {
    std::lock_guard lock(mutex_);
    if (gui) {
        prefs_.default_gui_connection = connection;
    } else {
        prefs_.default_non_gui_connection = connection;
    }
}

void PrefsStore::set_connect_to_first(bool value) {
    std::lock_guard lock(mutex_);
    prefs_.connect_to_first = value;
}

std::string PrefsStore::ensure_client_id() {
    std::lock_guard lock(mutex_);
    if (prefs_.client_id.empty()) {
        prefs_.client_id = boost::uuids::to_string(boost::uuids::random_generator()());
        log().info("Generated client id {}", prefs_.client_id);
    }
    return prefs_.client_id;
}

// ========== Relay ==========

void PrefsStore::set_relay_enabled(bool value) {
    std::lock_guard lock(mutex_);
    prefs_.relay_enabled = value;
}

void PrefsStore::set_relay_email(const std::string& email) {
    std::lock_guard lock(mutex_);
    prefs_.relay_email = email;
}

void PrefsStore::set_relay_identity(const std::string& name, const std::string& callsign) {
    std::lock_guard lock(mutex_);
    prefs_.relay_name = name;
    prefs_.relay_callsign = callsign;
}

// ========== 平台特定函数 ==========

std::filesystem::path get_state_dir() {
#ifdef _WIN32
    if (auto appdata = std::getenv("LOCALAPPDATA")) {
        return std::filesystem::path(appdata) / "RigLink";
    }
    return std::filesystem::path("C:\\ProgramData\\RigLink");

#elif defined(__APPLE__)
    if (auto home = std::getenv("HOME")) {
        return std::filesystem::path(home) / "Library" / "Application Support" / "RigLink";
    }
    if (auto pw = getpwuid(getuid())) {
        return std::filesystem::path(pw->pw_dir) / "Library" / "Application Support" / "RigLink";
    }
    return std::filesystem::temp_directory_path() / "RigLink";

#else
    // Per-user state; the controller never runs as a system service
    if (auto xdg = std::getenv("XDG_DATA_HOME")) {
        return std::filesystem::path(xdg) / "riglink";
    }
    if (auto home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "riglink";
    }
    if (auto pw = getpwuid(getuid())) {
        return std::filesystem::path(pw->pw_dir) / ".local" / "share" / "riglink";
    }
    return std::filesystem::temp_directory_path() / "riglink";
#endif
}

std::filesystem::path resolve_state_dir(const std::string& configured) {
    if (!configured.empty()) {
        return std::filesystem::path(configured);
    }
    return get_state_dir();
}

} // namespace riglink::client
