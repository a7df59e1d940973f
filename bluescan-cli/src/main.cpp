/**
 * @file main.cpp
 * @brief BlueScan console entry point
 *
 * Runs one discovery session against BlueZ and prints the result.
 */

#include <bluescan/bluescan.h>
#include <getopt.h>
#include <iostream>
#include <string>

namespace {

void print_usage(const char *program) {
  std::cout << "Usage: " << program << " [options]\n"
            << "\n"
            << "Discover nearby classic and BLE Bluetooth devices.\n"
            << "\n"
            << "Options:\n"
            << "  -a, --adapter hciN        Bluetooth adapter (default: first)\n"
            << "  -d, --duration SECONDS    Scan duration (default: 8)\n"
            << "  -v, --verbose             Log per-device events\n"
            << "  -h, --help                Show this help\n"
            << "  -V, --version             Show the version\n";
}

} // namespace

int main(int argc, char *argv[]) {
  bluescan::ScanConfig config;
  bool verbose = false;

  static const option long_options[] = {
      {"adapter", required_argument, nullptr, 'a'},
      {"duration", required_argument, nullptr, 'd'},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {"version", no_argument, nullptr, 'V'},
      {nullptr, 0, nullptr, 0}};

  int opt;
  while ((opt = getopt_long(argc, argv, "a:d:vhV", long_options, nullptr)) !=
         -1) {
    switch (opt) {
    case 'a':
      config.adapter = optarg;
      break;
    case 'd': {
      auto duration = bluescan::parse_scan_duration(optarg);
      if (duration.is_error()) {
        std::cerr << duration.error().message << std::endl;
        return 1;
      }
      config.scan_duration = duration.value();
      break;
    }
    case 'v':
      verbose = true;
      break;
    case 'h':
      print_usage(argv[0]);
      return 0;
    case 'V':
      std::cout << "bluescan " << BLUESCAN_VERSION_STRING << " ("
                << BLUESCAN_PLATFORM_NAME << ")" << std::endl;
      return 0;
    default:
      print_usage(argv[0]);
      return 1;
    }
  }

  bluescan::setup_logger(verbose ? spdlog::level::debug : spdlog::level::info);

  auto platform = bluescan::make_bluez_platform(config);
  bluescan::ScanSession session(*platform);

  auto init = session.init(config);
  if (init.is_error()) {
    std::cerr << init.error().to_string() << std::endl;
    return 1;
  }

  session.on_error([](const bluescan::SessionError &e) {
    std::cerr << e.message << "\n\n" << e.troubleshooting << std::endl;
  });

  std::cout << "Scanning for Bluetooth devices..." << std::endl;

  auto result = session.run();
  if (result.is_error()) {
    return 1;
  }

  const auto &report = result.value();
  std::cout << report.message() << std::endl;
  for (const auto &record : report.records) {
    std::cout << "  " << record.name << "  " << record.id << "  "
              << record.status << std::endl;
  }

  return 0;
}
