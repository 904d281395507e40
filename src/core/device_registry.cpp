#include "core/device_registry.hpp"
#include "util/log.hpp"

namespace core
{

void merge_props(DeviceRecord &rec, const bus::RawDeviceProps &props)
{
    if (props.alias)
        rec.alias = alias_for(*props.alias, rec.address);
    if (props.rssi_invalidated)
        rec.rssi.reset();
    if (props.rssi)
        rec.rssi = props.rssi;
    if (props.connected)
        rec.connected = *props.connected;
    if (props.trusted)
        rec.trusted = *props.trusted;
    if (props.bonded)
        rec.bonded = *props.bonded;
    if (props.paired)
        rec.paired = *props.paired;
    if (props.battery)
        rec.battery = props.battery;
}

DeviceRecord &DeviceRegistry::upsert(const bus::RawDeviceProps &props, Origin origin_if_new)
{
    const std::string addr = normalize_mac(props.address);
    auto              it   = index_.find(addr);
    if (it != index_.end())
    {
        DeviceRecord &rec = records_[it->second];
        merge_props(rec, props);
        return rec;
    }

    DeviceRecord rec;
    rec.address = addr;
    rec.alias   = alias_for(std::string{}, addr);
    rec.origin  = origin_if_new;
    merge_props(rec, props);

    index_.emplace(addr, records_.size());
    records_.push_back(std::move(rec));
    LOG_DEBUG("[REGISTRY] new %s record %s (%s)", origin_name(origin_if_new), addr.c_str(),
              records_.back().alias.c_str());
    return records_.back();
}

void DeviceRegistry::seed(const std::vector<bus::RawDeviceProps> &known)
{
    for (const auto &props : known)
    {
        if (!is_valid_mac(props.address))
        {
            LOG_WARN("[REGISTRY] known device with bad address '%s' ignored",
                     props.address.c_str());
            continue;
        }
        (void)upsert(props, Origin::Known);
    }
}

// ======================================================================
// Function: DeviceRegistry::fold
// - In: Added or Changed event for one address
// - Out: unseen address -> new Discovered record at the end
//        seen address   -> fields merged in place, origin and slot kept
// ======================================================================
void DeviceRegistry::fold(const bus::DeviceEvent &ev)
{
    if (!is_valid_mac(ev.props.address))
    {
        LOG_WARN("[REGISTRY] event with bad address '%s' ignored", ev.props.address.c_str());
        return;
    }
    (void)upsert(ev.props, Origin::Discovered);
}

const DeviceRecord *DeviceRegistry::find(const std::string &address) const
{
    auto it = index_.find(normalize_mac(address));
    if (it == index_.end())
        return nullptr;
    return &records_[it->second];
}

void DeviceRegistry::clear()
{
    records_.clear();
    index_.clear();
}

}  // namespace core
