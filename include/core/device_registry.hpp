#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "bus/ibus_client.hpp"
#include "core/device_record.hpp"

namespace core
{

// Canonical, deduplicated device view for one invocation.
//
// seed() and fold() are pure functions of (current state, input): the same
// ordered inputs always yield the same snapshot(). A record keeps the slot of
// its first observation; later observations only update fields in place.
class DeviceRegistry
{
  public:
    void seed(const std::vector<bus::RawDeviceProps> &known);
    void fold(const bus::DeviceEvent &ev);

    ScanSnapshot        snapshot() const { return records_; }
    std::size_t         size() const { return records_.size(); }
    bool                empty() const { return records_.empty(); }
    const DeviceRecord *find(const std::string &address) const;
    void                clear();

  private:
    std::vector<DeviceRecord>                    records_;
    std::unordered_map<std::string, std::size_t> index_;  // address -> slot in records_

    DeviceRecord &upsert(const bus::RawDeviceProps &props, Origin origin_if_new);
};

// Applies the fields present in props to rec. Address and origin never change.
void merge_props(DeviceRecord &rec, const bus::RawDeviceProps &props);

}  // namespace core
