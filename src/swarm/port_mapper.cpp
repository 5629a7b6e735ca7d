#include "swarm/port_mapper.hpp"
#include "common/logger.hpp"
#include <cstdio>
#include <cstring>

PortMapper::PortMapper() {
    std::memset(&upnp_urls_, 0, sizeof(upnp_urls_));
    std::memset(&upnp_data_, 0, sizeof(upnp_data_));
    std::memset(lan_address_, 0, sizeof(lan_address_));
}

PortMapper::~PortMapper() {
    if (mapped_port_ != 0) {
        remove_port_mapping(mapped_port_);
    }
    if (upnp_dev_) {
        freeUPNPDevlist(upnp_dev_);
        upnp_dev_ = nullptr;
    }
    if (have_urls_) {
        FreeUPNPUrls(&upnp_urls_);
    }
}

bool PortMapper::discover_devices() {
    int error = 0;
    unsigned char ttl = 2; // Default TTL as advised by UDA 1.1

    LOG_INFO("Discovering UPnP devices...");
    upnp_dev_ = upnpDiscover(2000, nullptr, nullptr, 0, 0, ttl, &error);
    if (!upnp_dev_) {
        LOG_WARN("No UPnP devices found. Error: ", error);
        return false;
    }

#if MINIUPNPC_API_VERSION >= 18
    char wan_address[64];
    int igd = UPNP_GetValidIGD(upnp_dev_, &upnp_urls_, &upnp_data_, lan_address_, sizeof(lan_address_),
                               wan_address, sizeof(wan_address));
#else
    int igd = UPNP_GetValidIGD(upnp_dev_, &upnp_urls_, &upnp_data_, lan_address_, sizeof(lan_address_));
#endif
    if (igd == 1) {
        have_urls_ = true;
        LOG_INFO("Valid IGD found. Local IP: ", lan_address_);
        return true;
    }
    if (igd != 0) {
        have_urls_ = true; // urls were filled even though the IGD is not connected
    }
    LOG_WARN("No valid IGD found.");
    freeUPNPDevlist(upnp_dev_);
    upnp_dev_ = nullptr;
    return false;
}

std::string PortMapper::get_external_ip() {
    if (!upnp_dev_ || !upnp_urls_.controlURL || !upnp_urls_.controlURL[0]) {
        LOG_WARN("UPnP device not discovered or not initialized.");
        return "";
    }

    char external_ip[40];
    if (UPNP_GetExternalIPAddress(upnp_urls_.controlURL, upnp_data_.first.servicetype, external_ip) == UPNPCOMMAND_SUCCESS) {
        LOG_INFO("External IP Address: ", external_ip);
        return external_ip;
    }
    LOG_WARN("Failed to get external IP address.");
    return "";
}

bool PortMapper::add_port_mapping(int internal_port, int external_port, const std::string& description, const std::string& protocol) {
    if (!upnp_dev_ || !upnp_urls_.controlURL || !upnp_urls_.controlURL[0]) {
        LOG_WARN("UPnP device not discovered or not initialized.");
        return false;
    }

    char external_port_str[16];
    char internal_port_str[16];
    std::snprintf(external_port_str, sizeof(external_port_str), "%d", external_port);
    std::snprintf(internal_port_str, sizeof(internal_port_str), "%d", internal_port);

    LOG_INFO("Adding port mapping: external ", external_port, " -> internal ", lan_address_, ":", internal_port, " (", protocol, ")");

    int r = UPNP_AddPortMapping(upnp_urls_.controlURL, upnp_data_.first.servicetype,
                                external_port_str, internal_port_str, lan_address_,
                                description.c_str(), protocol.c_str(), nullptr, "0"); // "0" for infinite lease time
    if (r == UPNPCOMMAND_SUCCESS) {
        mapped_port_ = external_port;
        return true;
    }
    LOG_WARN("Failed to add port mapping. Error: ", r, " (", strupnperror(r), ")");
    return false;
}

bool PortMapper::remove_port_mapping(int external_port, const std::string& protocol) {
    if (!upnp_dev_ || !upnp_urls_.controlURL || !upnp_urls_.controlURL[0]) {
        return false;
    }

    char external_port_str[16];
    std::snprintf(external_port_str, sizeof(external_port_str), "%d", external_port);

    int r = UPNP_DeletePortMapping(upnp_urls_.controlURL, upnp_data_.first.servicetype,
                                   external_port_str, protocol.c_str(), nullptr);
    if (external_port == mapped_port_) {
        mapped_port_ = 0;
    }
    if (r == UPNPCOMMAND_SUCCESS) {
        LOG_INFO("Port mapping for ", external_port, " removed.");
        return true;
    }
    LOG_WARN("Failed to remove port mapping. Error: ", r, " (", strupnperror(r), ")");
    return false;
}
