#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

namespace syncguard {

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top level scalars become `--key` entries in @p opts. A nested map is
 * flattened one level, so `logging: {json-log: true}` yields `--json-log`.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by long flag.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout as load_yaml_config().
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Read `KEY=VALUE` assignments from an env file.
 *
 * Blank lines and `#` comments are skipped, an `export ` prefix is accepted
 * and a value wrapped in single or double quotes is unquoted.
 *
 * @return `false` with @p error set when the file cannot be read or a line
 *         is not an assignment.
 */
bool load_env_file(const std::string& path, std::map<std::string, std::string>& vars,
                   std::string& error);

/**
 * @brief Translate environment variables into `--key` option values.
 *
 * `SYNCGUARD_LOG_FILE`, `SYNCGUARD_LOCK_FILE`, `SYNCGUARD_SHOW_OUTPUT` and
 * `SYNCGUARD_TRANSFER_CMD` are recognized, as are the legacy names
 * `AWS_S3_SYNC_LOG_FILE`, `AWS_S3_SYNC_LOCK_FILE` and `SHOW_OUTPUT`. When
 * both spellings are set the `SYNCGUARD_` one wins. Other variables are
 * ignored.
 */
std::map<std::string, std::string> env_to_options(const std::map<std::string, std::string>& vars);

/// Snapshot of the process environment.
std::map<std::string, std::string> current_environment();

} // namespace syncguard

#endif // CONFIG_UTILS_HPP
