#pragma once
// DNS.hpp — Linux: включение/выключение AdGuard DNS через resolvconf.
// 1) пишем шаблон в head-файл resolvconf (ResolvHead::File);
// 2) вызываем "resolvconf -u", чтобы пересобрать /etc/resolv.conf;
// 3) опционально — FlushCaches у systemd-resolved через sd-bus (если собран с libsystemd).

#include "Core/Process.hpp"
#include "ResolvHead.hpp"

class DNS
{
public:
    struct Params
    {
        Process::Command reload { "resolvconf", { "-u" } };

        bool flush_resolved_cache = true;   // org.freedesktop.resolve1.Manager.FlushCaches
    };

public:
    DNS(ResolvHead::File &head, const Params &p);

    DNS(const DNS&)            = delete;
    DNS& operator=(const DNS&) = delete;
    DNS(DNS&&)                 = delete;
    DNS& operator=(DNS&&)      = delete;

    // Шаблон + AdGuard nameserver'ы, затем reload.
    void Activate();
    // Только шаблон, затем reload.
    void Deactivate();

private:
    // Process::SpawnError пробрасывается наверх
    void Reload_();

    bool Systemd_FlushCaches_();

    static bool IsElevated_();

private:
    ResolvHead::File &head_;
    Params            p_;
};
