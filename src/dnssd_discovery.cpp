// SPDX-License-Identifier: Apache-2.0
#include "discovery.hpp"

#include <stdexcept>

#include <everest/logging.hpp>

#ifdef HAVE_DNSSD
#include <algorithm>
#include <cstdint>
#include <set>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>

#include <dns_sd.h>
#endif

namespace homewizard {

#ifdef HAVE_DNSSD
namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds POLL_SLICE(100);
constexpr std::chrono::milliseconds RESOLVE_TIMEOUT(2000);

/// Owns one DNSServiceRef.
class ServiceRef {
public:
    ServiceRef() = default;
    ~ServiceRef() {
        if (ref_) {
            DNSServiceRefDeallocate(ref_);
        }
    }
    ServiceRef(const ServiceRef&) = delete;
    ServiceRef& operator=(const ServiceRef&) = delete;

    DNSServiceRef* out() {
        return &ref_;
    }
    DNSServiceRef get() const {
        return ref_;
    }

private:
    DNSServiceRef ref_{nullptr};
};

/// Process replies on \p ref until \p finished, \p until, or \p stop. Returns false on a daemon error.
template <typename Pred>
bool process_until(const ServiceRef& ref, Clock::time_point until, const StopSignal& stop, Pred finished) {
    const int fd = DNSServiceRefSockFD(ref.get());
    if (fd < 0) {
        return false;
    }
    while (!finished() && !stop.requested()) {
        const auto now = Clock::now();
        if (now >= until) {
            return true;
        }
        const auto slice = std::min(POLL_SLICE, std::chrono::duration_cast<std::chrono::milliseconds>(until - now));
        pollfd pfd{fd, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(slice.count()));
        if (rc < 0) {
            return false;
        }
        if (rc > 0 && DNSServiceProcessResult(ref.get()) != kDNSServiceErr_NoError) {
            return false;
        }
    }
    return true;
}

struct BrowsedInstance {
    std::string name;
    std::string regtype;
    std::string domain;
    uint32_t interface_index{0};
};

struct BrowseState {
    std::vector<BrowsedInstance> pending;
    std::set<std::string> seen;
};

void DNSSD_API on_browse_reply(DNSServiceRef, DNSServiceFlags flags, uint32_t interface_index,
                               DNSServiceErrorType error, const char* name, const char* regtype,
                               const char* domain, void* context) {
    auto* state = static_cast<BrowseState*>(context);
    if (error != kDNSServiceErr_NoError || !(flags & kDNSServiceFlagsAdd)) {
        return;
    }
    if (!state->seen.insert(name).second) {
        return;
    }
    state->pending.push_back(BrowsedInstance{name, regtype, domain, interface_index});
}

struct ResolveState {
    bool done{false};
    std::string host_target;
    std::string product_type;
    std::string serial;
};

std::string txt_value(uint16_t txt_len, const unsigned char* txt, const char* key) {
    uint8_t value_len = 0;
    const void* value = TXTRecordGetValuePtr(txt_len, txt, key, &value_len);
    if (!value) {
        return {};
    }
    return std::string(static_cast<const char*>(value), value_len);
}

void DNSSD_API on_resolve_reply(DNSServiceRef, DNSServiceFlags, uint32_t, DNSServiceErrorType error, const char*,
                                const char* host_target, uint16_t, uint16_t txt_len, const unsigned char* txt,
                                void* context) {
    auto* state = static_cast<ResolveState*>(context);
    state->done = true;
    if (error != kDNSServiceErr_NoError) {
        return;
    }
    state->host_target = host_target ? host_target : "";
    if (!state->host_target.empty() && state->host_target.back() == '.') {
        state->host_target.pop_back();
    }
    state->product_type = txt_value(txt_len, txt, "product_type");
    state->serial = txt_value(txt_len, txt, "serial");
}

struct AddressState {
    bool done{false};
    std::string address;
};

void DNSSD_API on_address_reply(DNSServiceRef, DNSServiceFlags, uint32_t, DNSServiceErrorType error, const char*,
                                const struct sockaddr* address, uint32_t, void* context) {
    auto* state = static_cast<AddressState*>(context);
    state->done = true;
    if (error != kDNSServiceErr_NoError || !address || address->sa_family != AF_INET) {
        return;
    }
    char buffer[INET_ADDRSTRLEN] = {0};
    const auto* in = reinterpret_cast<const sockaddr_in*>(address);
    if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer))) {
        state->address = buffer;
    }
}

class DnssdDiscovery : public DiscoveryService {
public:
    void discover(Clock::time_point deadline, const StopSignal& stop, const DeviceFoundCallback& on_found) override {
        BrowseState browse_state;
        ServiceRef browse;
        const auto err = DNSServiceBrowse(browse.out(), 0, 0, HOMEWIZARD_SERVICE_TYPE, nullptr, on_browse_reply,
                                          &browse_state);
        if (err != kDNSServiceErr_NoError) {
            throw std::runtime_error("DNSServiceBrowse failed with error " + std::to_string(err));
        }
        EVLOG_debug << "Browsing " << HOMEWIZARD_SERVICE_TYPE;

        while (!stop.requested() && Clock::now() < deadline) {
            if (!process_until(browse, std::min(deadline, Clock::now() + POLL_SLICE), stop,
                               [&]() { return !browse_state.pending.empty(); })) {
                throw std::runtime_error("lost connection to the DNS-SD daemon");
            }
            auto pending = std::move(browse_state.pending);
            browse_state.pending.clear();
            for (const auto& instance : pending) {
                if (stop.requested()) {
                    return;
                }
                resolve(instance, deadline, stop, on_found);
            }
        }
    }

private:
    void resolve(const BrowsedInstance& instance, Clock::time_point deadline, const StopSignal& stop,
                 const DeviceFoundCallback& on_found) {
        const auto until = std::min(deadline, Clock::now() + RESOLVE_TIMEOUT);

        ResolveState resolved;
        {
            ServiceRef ref;
            if (DNSServiceResolve(ref.out(), 0, instance.interface_index, instance.name.c_str(),
                                  instance.regtype.c_str(), instance.domain.c_str(), on_resolve_reply,
                                  &resolved) != kDNSServiceErr_NoError) {
                EVLOG_warning << "Cannot resolve '" << instance.name << "'";
                return;
            }
            process_until(ref, until, stop, [&]() { return resolved.done; });
        }
        if (resolved.host_target.empty()) {
            EVLOG_debug << "No answer resolving '" << instance.name << "'";
            return;
        }

        const auto type = device_type_from_product(resolved.product_type);
        if (!type.has_value()) {
            EVLOG_debug << "Skipping '" << instance.name << "' with unsupported product type '"
                        << resolved.product_type << "'";
            return;
        }

        AddressState address;
        {
            ServiceRef ref;
            if (DNSServiceGetAddrInfo(ref.out(), 0, instance.interface_index, kDNSServiceProtocol_IPv4,
                                      resolved.host_target.c_str(), on_address_reply,
                                      &address) == kDNSServiceErr_NoError) {
                process_until(ref, until, stop, [&]() { return address.done; });
            }
        }

        DiscoveredDevice device;
        device.instance = instance.name;
        device.host = address.address.empty() ? resolved.host_target : address.address;
        device.type = *type;
        device.product_type = resolved.product_type;
        device.serial = resolved.serial;
        on_found(device);
    }
};

} // namespace
#endif

std::unique_ptr<DiscoveryService> make_dnssd_discovery() {
#ifdef HAVE_DNSSD
    return std::make_unique<DnssdDiscovery>();
#else
    EVLOG_error << "DNS-SD discovery requested but this build has no DNS-SD support";
    throw std::runtime_error("built without DNS-SD support, pass --host to pair a single device");
#endif
}

} // namespace homewizard
