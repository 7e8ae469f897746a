#include <scorekeeper/settings.hh>
#include <sklib/config_file.hh>
#include <sklib/debug.hh>

namespace scorekeeper {

namespace {

ConfigFile make_config_file() {
    ConfigFile cf;
    cf.add_vars(
        "data_dir",
        "sync_url",
        "event_code",
        "apikey",
        "sync_timeout_ms",
        "sync_queue_limit",
        "log_file",
        "error_log_file"
    );
    return cf;
}

Settings settings_from(const ConfigFile& cf) {
    Settings res;
    if (cf["data_dir"].is_set()) {
        res.data_dir = cf["data_dir"].as_string();
        if (res.data_dir.empty()) {
            THROW("config: data_dir cannot be empty");
        }
    }

    const auto& sync_url = cf["sync_url"];
    const auto& event_code = cf["event_code"];
    const auto& apikey = cf["apikey"];
    int credentials_set = sync_url.is_set() + event_code.is_set() + apikey.is_set();
    if (credentials_set == 3) {
        auto url = sync_url.as_string();
        while (not url.empty() and url.back() == '/') {
            url.pop_back();
        }
        res.sync_credentials = sync::Credentials{
            .sync_url = std::move(url),
            .event_code = event_code.as_string(),
            .apikey = apikey.as_string(),
        };
    } else if (credentials_set != 0) {
        THROW("config: sync_url, event_code and apikey have to be set together");
    }

    if (const auto& var = cf["sync_timeout_ms"]; var.is_set()) {
        auto timeout = var.as<int64_t>();
        if (not timeout or *timeout <= 0) {
            THROW("config: line ", var.line(), ": sync_timeout_ms has to be a positive integer");
        }
        res.sync_timeout = std::chrono::milliseconds{*timeout};
    }

    if (const auto& var = cf["sync_queue_limit"]; var.is_set()) {
        auto limit = var.as<size_t>();
        if (not limit) {
            THROW("config: line ", var.line(), ": sync_queue_limit has to be a non-negative integer");
        }
        res.sync_queue_limit = *limit;
    }

    res.log_file = cf["log_file"].as_string();
    res.error_log_file = cf["error_log_file"].as_string();
    return res;
}

} // namespace

Settings load_settings_from_string(std::string config) {
    auto cf = make_config_file();
    cf.load_config_from_string(std::move(config));
    return settings_from(cf);
}

Settings load_settings_from_file(const std::string& path) {
    auto cf = make_config_file();
    cf.load_config_from_file(path);
    return settings_from(cf);
}

} // namespace scorekeeper
