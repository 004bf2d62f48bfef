// Client.cpp — cfg-adguard-dns: --activate / --deactivate / --status / --help.
// Логирование через Boost.Log макросы LOG*; пользовательский вывод — в out/err.

#include "Core/Logger.hpp"
#include "ResolvHead.hpp"
#include "DNS.hpp"
#include "Status.hpp"
#include "Client.hpp"

#include <stdexcept>

namespace
{
    const std::string HELP_MESSAGE =
        "\n"
        "Usage: sudo cfg-adguard-dns [options...]\n"
        "\n"
        "        --activate      Activate AdGuard DNS server \n"
        "        --deactivate    Deactivate AdGuard DNS server \n"
        "        --status        Shows wether AdGuard DNS server is activated or not\n"
        "        --help          Display the current help message\n"
        "\n"
        "Disclaimer: Using this tool will restore the /etc/resolvconf/resolv.conf.d/head file to its default state.\n";

    const char *UNKNOWN_ARGUMENT =
        "Unknown argument. Try `cfg-adguard-dns --help` for more information";

    const char *VerbName(Client::Verb v)
    {
        switch (v)
        {
            case Client::Verb::Help:       return "help";
            case Client::Verb::Activate:   return "activate";
            case Client::Verb::Deactivate: return "deactivate";
            case Client::Verb::Status:     return "status";
            case Client::Verb::Unknown:    break;
        }
        return "unknown";
    }

    int Fatal(std::ostream &err, const std::exception &e)
    {
        LOGE("client") << "Fatal: " << e.what();
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

Client::Verb Client::ParseVerb(const std::vector<std::string> &args)
{
    if (args.size() < 2)
        return Verb::Help;

    const std::string &a = args[1];
    if (a == "--help")                          return Verb::Help;
    if (a == "--activate"   || a == "activate")   return Verb::Activate;
    if (a == "--deactivate" || a == "deactivate") return Verb::Deactivate;
    if (a == "--status"     || a == "status")     return Verb::Status;
    return Verb::Unknown;
}

const std::string &Client::HelpText()
{
    return HELP_MESSAGE;
}

int Client::Run(const std::vector<std::string> &args,
                const Config::Settings     &settings,
                std::ostream               &out,
                std::ostream               &err)
{
    try
    {
        const std::string path = ResolvHead::GetPath();
        LOGD("client") << "Head file: " << path;

        // Файл создаётся/обнуляется ДО разбора аргументов — для любой команды,
        // включая --help и неизвестный аргумент.
        ResolvHead::File head(path);

        const Verb verb = ParseVerb(args);
        LOGD("client") << "Command: " << VerbName(verb);

        DNS::Params dns_p;
        dns_p.reload               = settings.reload;
        dns_p.flush_resolved_cache = settings.flush_resolved_cache;

        switch (verb)
        {
            case Verb::Help:
                out << HelpText() << "\n";
                break;

            case Verb::Activate:
            {
                DNS dns(head, dns_p);
                dns.Activate();
                LOGI("client") << "AdGuard DNS activated in " << path;
                break;
            }

            case Verb::Deactivate:
            {
                DNS dns(head, dns_p);
                dns.Deactivate();
                LOGI("client") << "AdGuard DNS deactivated in " << path;
                break;
            }

            case Verb::Status:
            {
                const Status::State st = Status::Query(settings.lookup);
                if (st == Status::State::Undecodable)
                    err << Status::Describe(st) << "\n";
                else
                    out << Status::Describe(st) << "\n";
                break;
            }

            case Verb::Unknown:
                LOGW("client") << "Unknown argument: " << args[1];
                err << UNKNOWN_ARGUMENT << "\n";
                break;
        }

        out.flush();
        return 0;
    }
    catch (const std::exception &e)
    {
        return Fatal(err, e);
    }
}
