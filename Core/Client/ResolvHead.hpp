#pragma once

// ResolvHead.hpp — файл "head" для resolvconf(8): его содержимое resolvconf
// ставит в начало сгенерированного /etc/resolv.conf.
// Здесь же — статические шаблоны, которые мы туда пишем.

#include <string>
#include <vector>

namespace ResolvHead
{
    constexpr const char *PATH_ENV_VAR = "RESOLVCONF_HEAD_PATH";
    constexpr const char *DEFAULT_PATH = "/etc/resolvconf/resolv.conf.d/head";

    // Значение PATH_ENV_VAR, если переменная задана (в т.ч. пустая), иначе DEFAULT_PATH.
    std::string GetPath();

    // Шапка "не редактировать руками" — пишется всегда.
    const std::string &BaseTemplate();

    // Блок с nameserver'ами AdGuard DNS.
    const std::string &ProviderBlock();

    // BaseTemplate() + ' ' + ProviderBlock()
    const std::string &ExtendedTemplate();

    // Адреса из ProviderBlock(), по ним определяется статус.
    const std::vector<std::string> &ProviderServers();

    // RAII-дескриптор целевого файла. Открывается с O_CREAT|O_TRUNC,
    // т.е. содержимое обнуляется уже в конструкторе.
    class File
    {
    public:
        // std::system_error (errno) если файл не удалось создать
        explicit File(const std::string &path);
        ~File();

        File(const File&)            = delete;
        File& operator=(const File&) = delete;

        // Дописывает в текущую позицию. std::runtime_error при сбое записи.
        void Write(const std::string &content);

        const std::string &Path() const { return path_; }

    private:
        std::string path_;
        int         fd_ = -1;
    };
}
