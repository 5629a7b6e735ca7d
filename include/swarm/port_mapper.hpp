#ifndef INSTSHARE_PORT_MAPPER_HPP
#define INSTSHARE_PORT_MAPPER_HPP

#include <string>

// miniupnpc includes
#include <miniupnpc/miniupnpc.h>
#include <miniupnpc/upnpcommands.h>
#include <miniupnpc/upnperrors.h>

/**
 * @brief UPnP IGD port mapping for the swarm listen port.
 *
 * All calls block on the network; use from a worker thread.
 */
class PortMapper {
public:
    PortMapper();
    ~PortMapper();

    PortMapper(const PortMapper&) = delete;
    PortMapper& operator=(const PortMapper&) = delete;

    bool discover_devices();
    std::string get_external_ip();
    bool add_port_mapping(int internal_port, int external_port, const std::string& description, const std::string& protocol = "TCP");
    bool remove_port_mapping(int external_port, const std::string& protocol = "TCP");

    bool has_mapping() const { return mapped_port_ != 0; }

private:
    struct UPNPDev* upnp_dev_ = nullptr;
    struct UPNPUrls upnp_urls_;
    struct IGDdatas upnp_data_;
    char lan_address_[64];
    bool have_urls_ = false;
    int mapped_port_ = 0;
};

#endif // INSTSHARE_PORT_MAPPER_HPP
