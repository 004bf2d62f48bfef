#include "Status.hpp"
#include "ResolvHead.hpp"
#include "Core/Logger.hpp"

#include <cstdint>

namespace
{
    // только для сообщения об ошибке; сама команда задаётся в Config::Settings
    const char *LOOKUP_TOOL   = "nslookup";
    const char *LOOKUP_TARGET = "wikipedia.org";

    // Длина последовательности по ведущему байту, 0 — недопустимый ведущий байт
    int SeqLen(std::uint8_t c)
    {
        if (c < 0x80)               return 1;
        if (c >= 0xC2 && c <= 0xDF) return 2;
        if (c >= 0xE0 && c <= 0xEF) return 3;
        if (c >= 0xF0 && c <= 0xF4) return 4;
        return 0;
    }
}

// Строгая проверка: без overlong-форм, суррогатов и кодов выше U+10FFFF.
bool Status::IsValidUtf8(const std::string &bytes)
{
    const auto  *s = reinterpret_cast<const std::uint8_t*>(bytes.data());
    std::size_t  n = bytes.size();
    std::size_t  i = 0;

    while (i < n)
    {
        const int len = SeqLen(s[i]);
        if (len == 0 || i + len > n) return false;

        if (len >= 2)
        {
            const std::uint8_t b1 = s[i + 1];
            std::uint8_t lo = 0x80, hi = 0xBF;
            if (s[i] == 0xE0) lo = 0xA0;
            if (s[i] == 0xED) hi = 0x9F;
            if (s[i] == 0xF0) lo = 0x90;
            if (s[i] == 0xF4) hi = 0x8F;
            if (b1 < lo || b1 > hi) return false;

            for (int k = 2; k < len; ++k)
            {
                if ((s[i + k] & 0xC0) != 0x80) return false;
            }
        }
        i += static_cast<std::size_t>(len);
    }
    return true;
}

Status::State Status::Classify(const std::string &lookup_output)
{
    if (!IsValidUtf8(lookup_output))
        return State::Undecodable;

    for (const auto &ip : ResolvHead::ProviderServers())
    {
        if (lookup_output.find(ip) != std::string::npos)
        {
            LOGD("status") << "Matched provider address " << ip;
            return State::Activated;
        }
    }
    return State::Deactivated;
}

Status::State Status::Query(const Process::Command &lookup)
{
    LOGD("status") << "Lookup: " << Process::ToString(lookup);

    const Process::Result r = Process::Run(lookup);
    const State st = Classify(r.out);

    LOGI("status") << "Lookup exit=" << r.exit_code
                   << " bytes=" << r.out.size()
                   << " state=" << Describe(st);
    return st;
}

std::string Status::Describe(State state)
{
    switch (state)
    {
        case State::Activated:   return "ADGUARD DNS is activated";
        case State::Deactivated: return "ADGUARD DNS is deactivated";
        case State::Undecodable: break;
    }
    return std::string(LOOKUP_TOOL) + " is not installed or could not lookup " + LOOKUP_TARGET;
}
