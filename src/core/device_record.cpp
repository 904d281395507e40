#include <algorithm>
#include <cctype>

#include "core/device_record.hpp"

namespace core
{

std::string dash_address(const std::string &address)
{
    std::string out = address;
    std::replace(out.begin(), out.end(), ':', '-');
    return out;
}

std::string alias_for(const std::string &explicit_alias, const std::string &address)
{
    if (!explicit_alias.empty())
        return explicit_alias;
    return dash_address(address);
}

std::string alias_for(const DeviceRecord &rec)
{
    return alias_for(rec.alias, rec.address);
}

bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

std::string normalize_mac(std::string mac)
{
    std::transform(mac.begin(), mac.end(), mac.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return mac;
}

const char *origin_name(Origin o)
{
    return o == Origin::Known ? "known" : "discovered";
}

}  // namespace core
