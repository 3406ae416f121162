#include "s3io/store_config.hpp"
#include "s3io/log.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace s3io {

namespace {

const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

bool env_flag(const char* value) {
    return std::strcmp(value, "1") == 0 || std::strcmp(value, "true") == 0 ||
           std::strcmp(value, "yes") == 0 || std::strcmp(value, "on") == 0;
}

}  // namespace

StoreConfig StoreConfig::from_env() {
    StoreConfig config;

    if (const char* v = env_or_null("AWS_ACCESS_KEY_ID")) config.access_key = v;
    if (const char* v = env_or_null("AWS_SECRET_ACCESS_KEY")) config.secret_key = v;
    if (const char* v = env_or_null("AWS_SESSION_TOKEN")) config.session_token = v;

    if (const char* v = env_or_null("AWS_REGION")) {
        config.region = v;
    } else if (const char* d = env_or_null("AWS_DEFAULT_REGION")) {
        config.region = d;
    }

    if (const char* v = env_or_null("AWS_ENDPOINT_URL_S3")) {
        config.endpoint = v;
    } else if (const char* g = env_or_null("AWS_ENDPOINT_URL")) {
        config.endpoint = g;
    }

    if (const char* v = env_or_null("S3IO_PATH_STYLE")) config.use_path_style = env_flag(v);
    if (const char* v = env_or_null("S3IO_VERBOSE")) config.verbose = env_flag(v);

    return config;
}

bool StoreConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            log_error("cannot open config file: %s", path.c_str());
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        StoreConfig next = *this;
        if (j.contains("region")) next.region = j["region"].get<std::string>();
        if (j.contains("endpoint")) next.endpoint = j["endpoint"].get<std::string>();
        if (j.contains("access_key")) next.access_key = j["access_key"].get<std::string>();
        if (j.contains("secret_key")) next.secret_key = j["secret_key"].get<std::string>();
        if (j.contains("session_token")) next.session_token = j["session_token"].get<std::string>();
        if (j.contains("use_path_style")) next.use_path_style = j["use_path_style"].get<bool>();
        if (j.contains("verify_ssl")) next.verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("ca_bundle_path")) next.ca_bundle_path = j["ca_bundle_path"].get<std::string>();
        if (j.contains("connect_timeout")) next.connect_timeout_secs = j["connect_timeout"].get<uint32_t>();
        if (j.contains("request_timeout")) next.request_timeout_secs = j["request_timeout"].get<uint32_t>();
        if (j.contains("max_retries")) next.max_retries = j["max_retries"].get<uint32_t>();
        if (j.contains("max_response_size")) next.max_response_size = j["max_response_size"].get<size_t>();
        if (j.contains("io_threads")) next.io_threads = j["io_threads"].get<size_t>();
        if (j.contains("user_agent")) next.user_agent = j["user_agent"].get<std::string>();
        if (j.contains("verbose")) next.verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) next.metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) next.metrics_interval_secs = j["metrics_interval"].get<size_t>();

        *this = std::move(next);
        return true;
    } catch (const std::exception& e) {
        log_error("parsing config %s: %s", path.c_str(), e.what());
        return false;
    }
}

std::string StoreConfig::validate() const {
    if (region.empty()) return "region is required";
    if (!endpoint.empty() &&
        !endpoint.starts_with("http://") && !endpoint.starts_with("https://")) {
        return "endpoint must start with http:// or https://: " + endpoint;
    }
    if (access_key.empty() != secret_key.empty()) {
        return "access_key and secret_key must be set together";
    }
    if (!session_token.empty() && access_key.empty()) {
        return "session_token requires access_key and secret_key";
    }
    if (io_threads == 0) return "io_threads must be > 0";
    if (connect_timeout_secs == 0) return "connect_timeout must be > 0";
    if (request_timeout_secs == 0) return "request_timeout must be > 0";
    if (!metrics_file.empty() && metrics_interval_secs == 0) {
        return "metrics_interval must be > 0";
    }
    return {};
}

}  // namespace s3io
