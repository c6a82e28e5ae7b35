// XRFrame Core
// config.cpp - JSON-based configuration system implementation

#include <nlohmann/json.hpp>

#include <xrframe/core/config.hpp>
#include <xrframe/core/logger.hpp>
#include <xrframe/platform/file_io.hpp>

namespace xrframe::core {

using json = nlohmann::json;

namespace {

// Returns the value at section.key, or nullptr if either level is missing
const json* find_value(const json& data, std::string_view section, std::string_view key) {
    auto section_it = data.find(std::string(section));
    if (section_it == data.end() || !section_it->is_object()) {
        return nullptr;
    }
    auto key_it = section_it->find(std::string(key));
    if (key_it == section_it->end()) {
        return nullptr;
    }
    return &*key_it;
}

template<typename T>
T get_or(const json& data, std::string_view section, std::string_view key, T default_value) {
    const json* value = find_value(data, section, key);
    if (value == nullptr) {
        return default_value;
    }
    try {
        return value->get<T>();
    } catch (const json::exception& e) {
        XRFRAME_LOG_WARN(log_category::CONFIG, "Type mismatch for {}.{}: {}", section, key, e.what());
        return default_value;
    }
}

}  // namespace

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

    template<typename T>
    void assign(std::string_view section, std::string_view key, T&& value) {
        data[std::string(section)][std::string(key)] = std::forward<T>(value);
        dirty = true;
        if (change_callback) {
            change_callback(section, key);
        }
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
    impl_->dirty = false;
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        XRFRAME_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        return false;
    }
    impl_->path = path;
    XRFRAME_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view content) {
    try {
        auto parsed = json::parse(content);
        if (!parsed.is_object()) {
            XRFRAME_LOG_ERROR(log_category::CONFIG, "Config root must be a JSON object");
            return false;
        }
        // Missing keys keep their defaults
        set_defaults();
        impl_->data.merge_patch(parsed);
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        XRFRAME_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent)) {
        if (!platform::FileSystem::create_directories(parent)) {
            XRFRAME_LOG_ERROR(log_category::CONFIG, "Failed to create config directory: {}", parent.string());
            return false;
        }
    }

    std::string content = impl_->data.dump(4);

    if (!platform::FileSystem::write_text(path, content)) {
        XRFRAME_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    XRFRAME_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        XRFRAME_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
        return false;
    }
    return save(impl_->path);
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (!save(path)) {
        XRFRAME_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    return get_or<int>(impl_->data, section, key, default_value);
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    return get_or<double>(impl_->data, section, key, default_value);
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    return get_or<bool>(impl_->data, section, key, default_value);
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    return get_or<std::string>(impl_->data, section, key, std::string(default_value));
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->assign(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->assign(section, key, value);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->assign(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->assign(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return find_value(impl_->data, section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->data[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::SWAPCHAIN, {{config_key::WAIT_TIMEOUT_MS, 100}, {config_key::DEBUG_NAMES, true}}},
                       {config_section::DEBUG, {{config_key::LOG_LEVEL, "info"}, {config_key::LOG_FILE, ""}}}};
    impl_->dirty = true;
}

}  // namespace xrframe::core
