/**
 * @file device_store.cpp
 * @brief Device record store implementation
 */

#include "bluescan/device_store.h"

namespace bluescan {

DeviceRecord DeviceRecordStore::upsert(const std::string &id,
                                       const std::string &name,
                                       const std::string &status) {
  DeviceRecord result;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(id);
    if (it == index_.end()) {
      index_.emplace(id, records_.size());
      records_.push_back(DeviceRecord{id, name, status});
      result = records_.back();
    } else {
      DeviceRecord &existing = records_[it->second];
      if (is_placeholder_name(existing.name) && !is_placeholder_name(name)) {
        existing.name = name;
      }
      existing.status = status;
      result = existing;
    }
  }

  notify_changed();
  return result;
}

bool DeviceRecordStore::update_status(const std::string &id,
                                      const std::string &status) {
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(id);
    if (it == index_.end()) {
      return false;
    }
    records_[it->second].status = status;
  }

  notify_changed();
  return true;
}

std::optional<DeviceRecord>
DeviceRecordStore::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = index_.find(id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return records_[it->second];
}

void DeviceRecordStore::clear() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    index_.clear();
  }

  notify_changed();
}

DeviceRecordList DeviceRecordStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

size_t DeviceRecordStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

bool DeviceRecordStore::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.empty();
}

void DeviceRecordStore::on_changed(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  changed_cb_ = std::move(callback);
}

void DeviceRecordStore::notify_changed() {
  std::function<void()> callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = changed_cb_;
  }

  if (callback) {
    callback();
  }
}

} // namespace bluescan
