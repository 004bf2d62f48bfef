#include "DNS.hpp"
#include "Core/Logger.hpp"

#include <unistd.h>

#include <stdexcept>
#include <string>

#ifdef HAVE_LIBSYSTEMD
#include <systemd/sd-bus.h>
#endif

bool DNS::IsElevated_()
{
    return (::geteuid() == 0);
}

DNS::DNS(ResolvHead::File &head, const Params &p)
        : head_(head)
        , p_(p)
{
    if (p_.reload.program.empty())
        throw std::invalid_argument("DNS: reload command is empty");
}

void DNS::Activate()
{
    LOGI("dns") << "Activate: head=" << head_.Path()
                << " servers=" << (int)ResolvHead::ProviderServers().size();

    if (!IsElevated_())
        LOGW("dns") << "Not running as root, writing " << head_.Path() << " may fail";

    head_.Write(ResolvHead::ExtendedTemplate());
    Reload_();
}

void DNS::Deactivate()
{
    LOGI("dns") << "Deactivate: head=" << head_.Path();

    if (!IsElevated_())
        LOGW("dns") << "Not running as root, writing " << head_.Path() << " may fail";

    head_.Write(ResolvHead::BaseTemplate());
    Reload_();
}

void DNS::Reload_()
{
    LOGD("dns") << "Reload: " << Process::ToString(p_.reload);

    // вывод не нужен, код возврата только логируем (Process::Run)
    const Process::Result r = Process::Run(p_.reload);
    if (r.exit_code != 0)
    {
        LOGW("dns") << "Reload exited with " << r.exit_code << ", resolv.conf may be stale";
        return;
    }
    LOGI("dns") << "resolvconf updated";

    if (p_.flush_resolved_cache)
    {
        if (!Systemd_FlushCaches_())
            LOGD("dns") << "resolver cache not flushed";
    }
}

// ---------- systemd-resolved ----------
#ifdef HAVE_LIBSYSTEMD
bool DNS::Systemd_FlushCaches_()
{
    sd_bus *bus = nullptr;
    int rc = sd_bus_open_system(&bus);
    if (rc < 0)
    {
        LOGW("dns") << "sd_bus_open_system failed: " << rc;
        return false;
    }

    sd_bus_error    error = SD_BUS_ERROR_NULL;
    sd_bus_message *reply = nullptr;
    rc = sd_bus_call_method(bus,
                            "org.freedesktop.resolve1",
                            "/org/freedesktop/resolve1",
                            "org.freedesktop.resolve1.Manager",
                            "FlushCaches",
                            &error, &reply, nullptr);
    if (rc < 0)
    {
        LOGW("dns") << "FlushCaches failed: "
                    << (error.message ? error.message : "rc=" + std::to_string(rc));
    }
    else
    {
        LOGI("dns") << "systemd-resolved: caches flushed";
    }

    sd_bus_error_free(&error);
    if (reply) sd_bus_message_unref(reply);
    sd_bus_unref(bus);
    return rc >= 0;
}
#else
bool DNS::Systemd_FlushCaches_()
{
    LOGD("dns") << "libsystemd not available at build time; skipping FlushCaches";
    return false;
}
#endif // HAVE_LIBSYSTEMD
