/**
 * @file bluetooth.cpp
 * @brief Platform interface helpers
 */

#include "bluescan/bluetooth.h"

namespace bluescan {

const char *watcher_status_name(WatcherStatus status) {
  switch (status) {
  case WatcherStatus::Created:
    return "Created";
  case WatcherStatus::Started:
    return "Started";
  case WatcherStatus::EnumerationCompleted:
    return "EnumerationCompleted";
  case WatcherStatus::Stopping:
    return "Stopping";
  case WatcherStatus::Stopped:
    return "Stopped";
  case WatcherStatus::Aborted:
    return "Aborted";
  default:
    return "Unknown";
  }
}

const char *
advertisement_watcher_status_name(AdvertisementWatcherStatus status) {
  switch (status) {
  case AdvertisementWatcherStatus::Created:
    return "Created";
  case AdvertisementWatcherStatus::Started:
    return "Started";
  case AdvertisementWatcherStatus::Stopping:
    return "Stopping";
  case AdvertisementWatcherStatus::Stopped:
    return "Stopped";
  case AdvertisementWatcherStatus::Aborted:
    return "Aborted";
  default:
    return "Unknown";
  }
}

} // namespace bluescan
