#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "apns_error.hpp"
#include "client/apns_client.hpp"
#include "conf/apns_client_config.hpp"
#include "request/notification.hpp"
#include "util/my_logging.hpp"

namespace po = boost::program_options;

namespace {

// Non-zero and distinct per failure kind so scripts can branch on it.
int exit_code_for(const apnsclient::Error &err) {
  return 10 + static_cast<int>(err.kind());
}

void print_failure(const apnsclient::Error &err) {
  std::cerr << fmt::format("{}: {}", err.kind_name(), err) << std::endl;
  if (auto detail = err.detail()) {
    std::cerr << "  detail: " << *detail << std::endl;
  }
  if (const auto *res = err.response()) {
    std::cerr << "  status: " << res->code << std::endl;
    if (res->apns_id) {
      std::cerr << "  apns-id: " << *res->apns_id << std::endl;
    }
    if (res->error && res->error->timestamp) {
      std::cerr << "  timestamp: " << *res->error->timestamp << std::endl;
    }
  }
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string device_token;
  std::string payload;
  std::string verbose;
  std::optional<std::string> topic;
  std::optional<std::string> push_type;
  std::optional<std::string> collapse_id;
  std::optional<std::string> apns_id;
  std::optional<int> priority;
  std::optional<std::uint64_t> expiration;
  std::optional<int> timeout_ms;

  po::options_description generic_desc("Send one push notification");
  try {
    generic_desc.add_options() //
        ("config,c", po::value<std::string>(&config_path)->required(),
         "path of the client configuration file.") //
        ("device-token,d", po::value<std::string>(&device_token)->required(),
         "hex device token of the recipient.") //
        ("payload,p",
         po::value<std::string>(&payload)->default_value(
             R"({"aps":{"alert":"Hello"}})"),
         "notification payload as JSON text.") //
        ("topic",
         po::value<std::string>()->notifier(
             [&](const std::string &v) { topic = v; }),
         "apns-topic, overrides the configured topic.") //
        ("push-type",
         po::value<std::string>()->notifier(
             [&](const std::string &v) { push_type = v; }),
         "alert, background, voip, ...") //
        ("priority",
         po::value<int>()->notifier([&](int v) { priority = v; }),
         "10, 5 or 1.") //
        ("collapse-id",
         po::value<std::string>()->notifier(
             [&](const std::string &v) { collapse_id = v; }),
         "apns-collapse-id.") //
        ("apns-id",
         po::value<std::string>()->notifier(
             [&](const std::string &v) { apns_id = v; }),
         "canonical UUID identifying the notification.") //
        ("expiration",
         po::value<std::uint64_t>()->notifier(
             [&](std::uint64_t v) { expiration = v; }),
         "apns-expiration, seconds since epoch.") //
        ("timeout-ms",
         po::value<int>()->notifier([&](int v) { timeout_ms = v; }),
         "time budget for the send, overrides the configuration.") //
        ("verbose", po::value<std::string>(&verbose),
         "log level: trace, debug, info, warning, error.") //
        ("help,h", "Print help");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, generic_desc), vm);
    if (vm.count("help")) {
      std::cout << generic_desc << std::endl;
      return EXIT_SUCCESS;
    }
    po::notify(vm);
  } catch (const po::error &ex) {
    std::cerr << ex.what() << std::endl << generic_desc << std::endl;
    return EXIT_FAILURE;
  }

  auto config = apnsclient::load_client_config(config_path);
  if (config.is_err()) {
    print_failure(config.error());
    return exit_code_for(config.error());
  }
  auto cfg = config.value();
  if (!verbose.empty()) {
    cfg.logging.level = verbose;
  }
  init_my_log(cfg.logging);

  apnsclient::NotificationOptions options;
  options.apns_topic = topic;
  options.apns_collapse_id = collapse_id;
  options.apns_id = apns_id;
  options.apns_expiration = expiration;
  if (push_type) {
    options.apns_push_type = apnsclient::parse_push_type(*push_type);
    if (!options.apns_push_type) {
      auto err = apnsclient::invalid_options(
          fmt::format("Unknown push type '{}'.", *push_type));
      print_failure(err);
      return exit_code_for(err);
    }
  }
  if (priority) {
    options.apns_priority = apnsclient::parse_priority(*priority);
    if (!options.apns_priority) {
      auto err = apnsclient::invalid_options(
          fmt::format("Priority must be 10, 5 or 1, got {}.", *priority));
      print_failure(err);
      return exit_code_for(err);
    }
  }

  auto notification =
      apnsclient::Notification::from_raw(device_token, payload, options);
  if (notification.is_err()) {
    print_failure(notification.error());
    return exit_code_for(notification.error());
  }

  auto client = apnsclient::ApnsClient::create(cfg);
  if (client.is_err()) {
    print_failure(client.error());
    return exit_code_for(client.error());
  }

  auto result =
      timeout_ms
          ? client.value()->send_with_timeout(
                notification.value(), std::chrono::milliseconds(*timeout_ms))
          : client.value()->send(notification.value());
  if (result.is_err()) {
    print_failure(result.error());
    return exit_code_for(result.error());
  }
  std::cout << "accepted apns-id="
            << result.value().apns_id.value_or("<none>") << std::endl;
  return EXIT_SUCCESS;
}
