#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <filesystem>
#include <string>


class Settings
{
public:
    Settings();

    bool load();
    bool save();

    std::string get_model() const;
    void set_model(const std::string& model);

    std::string get_endpoint_template() const;
    void set_endpoint_template(const std::string& value);

    int get_concurrency() const;
    void set_concurrency(int value);

    int get_timeout_seconds() const;
    void set_timeout_seconds(int value);

    RetryPolicy get_retry_policy() const;
    void set_retry_policy(const RetryPolicy& policy);

    std::string get_results_file() const;
    void set_results_file(const std::string& path);

    std::string get_success_file() const;
    void set_success_file(const std::string& path);

    std::string get_log_level() const;
    void set_log_level(const std::string& level);

    std::string define_config_path();
    std::string get_config_dir() const;
    std::string get_config_path() const;
    std::string get_log_dir() const;

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    std::string model{ProbeDefaults::kModel};
    std::string endpoint_template{ProbeDefaults::kEndpointTemplate};
    int concurrency{ProbeDefaults::kConcurrency};
    int timeout_seconds{ProbeDefaults::kTimeoutSeconds};
    RetryPolicy retry_policy;
    std::string results_file{ProbeDefaults::kResultsFile};
    std::string success_file{ProbeDefaults::kSuccessFile};
    std::string log_level{"info"};
};

#endif
