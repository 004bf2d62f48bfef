#include "ResolvHead.hpp"
#include "Core/Logger.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace
{
    const std::string BASE_TEMPLATE =
        "\n"
        "# Dynamic resolv.conf(5) file for glibc resolver(3) generated by resolvconf(8)\n"
        "#     DO NOT EDIT THIS FILE BY HAND -- YOUR CHANGES WILL BE OVERWRITTEN\n"
        "# 127.0.0.53 is the systemd-resolved stub resolver.\n"
        "# run \"systemd-resolve --status\" to see details about the actual nameservers.\n";

    const std::string DNS_SERVER_1_ADDR = "94.140.14.14";
    const std::string DNS_SERVER_2_ADDR = "94.149.15.15";

    const std::string PROVIDER_BLOCK =
        "\n"
        "# AdGuard DNS \n"
        "# https://adguard-dns.com/en/public-dns.html\n"
        "nameserver " + DNS_SERVER_1_ADDR + "\n"
        "nameserver " + DNS_SERVER_2_ADDR + "\n";

    const std::string EXTENDED_TEMPLATE = BASE_TEMPLATE + " " + PROVIDER_BLOCK;

    const std::vector<std::string> PROVIDER_SERVERS = { DNS_SERVER_1_ADDR, DNS_SERVER_2_ADDR };
}

std::string ResolvHead::GetPath()
{
    if (const char *value = std::getenv(PATH_ENV_VAR))
        return value;
    return DEFAULT_PATH;
}

const std::string &ResolvHead::BaseTemplate()
{
    return BASE_TEMPLATE;
}

const std::string &ResolvHead::ProviderBlock()
{
    return PROVIDER_BLOCK;
}

const std::string &ResolvHead::ExtendedTemplate()
{
    return EXTENDED_TEMPLATE;
}

const std::vector<std::string> &ResolvHead::ProviderServers()
{
    return PROVIDER_SERVERS;
}

ResolvHead::File::File(const std::string &path)
        : path_(path)
{
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (fd_ < 0)
    {
        const int err = errno;
        LOGE("resolvhead") << "Create failed: " << path_ << ": " << std::strerror(err);
        throw std::system_error(err, std::generic_category(), "cannot create " + path_);
    }
    LOGD("resolvhead") << "Opened (truncated): " << path_;
}

ResolvHead::File::~File()
{
    if (fd_ >= 0) ::close(fd_);
}

void ResolvHead::File::Write(const std::string &content)
{
    const char  *p    = content.data();
    std::size_t  left = content.size();

    while (left > 0)
    {
        const ssize_t n = ::write(fd_, p, left);
        if (n < 0)
        {
            if (errno == EINTR) continue;
            LOGE("resolvhead") << "Write failed: " << path_ << ": " << std::strerror(errno);
            throw std::runtime_error("failed to write default template");
        }
        p    += n;
        left -= static_cast<std::size_t>(n);
    }
    LOGT("resolvhead") << "Wrote " << content.size() << " bytes to " << path_;
}
