#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

/**
 * @file NetNS.hpp
 * @brief Сетевые namespace: открытие по пути и временное переключение потока.
 *
 * setns() действует только на вызывающий поток. Поэтому вся работа с
 * namespace выполняется в выделенном потоке команды (CommandThread), а
 * NetNS::Do гарантирует возврат в исходный namespace на любом выходе.
 */

namespace NetConfig
{
    /**
     * @brief Ошибка открытия namespace; Missing(): пути больше нет.
     */
    class NetNSOpenError : public std::runtime_error
    {
    public:
        NetNSOpenError(const std::string &what,
                       int                err)
            : std::runtime_error(what), errno_(err)
        {
        }

        int Errno() const { return errno_; }

        bool Missing() const;

    private:
        int errno_;
    };

    class NetNS
    {
    public:
        virtual ~NetNS() = default;

        virtual const std::string &Path() const = 0;

        /// Дескриптор namespace для IFLA_NET_NS_FD.
        virtual int Fd() const = 0;

        /**
         * @brief Выполнить fn с потоком, переключённым в этот namespace.
         *
         * Исходный namespace восстанавливается до возврата, в том числе
         * когда fn бросает исключение. Вложенные вызовы запрещены.
         */
        virtual void Do(const std::function<void(NetNS &)> &fn) = 0;
    };

    class NetNSOpener
    {
    public:
        virtual ~NetNSOpener() = default;

        /**
         * @throws NetNSOpenError
         */
        virtual std::unique_ptr<NetNS> Open(const std::string &path) = 0;
    };

    class LinuxNetNS : public NetNS
    {
    public:
        ~LinuxNetNS() override;

        LinuxNetNS(const LinuxNetNS &)            = delete;
        LinuxNetNS &operator=(const LinuxNetNS &) = delete;

        /**
         * @brief Открыть nsfs-файл (например /proc/<pid>/ns/net или /var/run/netns/x).
         * @throws NetNSOpenError если файла нет или это не сетевой namespace.
         */
        static std::unique_ptr<LinuxNetNS> Open(const std::string &path);

        const std::string &Path() const override { return path_; }
        int Fd() const override { return fd_; }

        void Do(const std::function<void(NetNS &)> &fn) override;

    private:
        LinuxNetNS(std::string path,
                   int         fd);

        std::string path_;
        int         fd_ = -1;
    };

    class LinuxNetNSOpener : public NetNSOpener
    {
    public:
        std::unique_ptr<NetNS> Open(const std::string &path) override;
    };

    /**
     * @brief Выделенный поток для одной команды.
     *
     * Поток живёт ровно одну команду и не используется ни для чего другого,
     * поэтому переключения namespace не видны остальному процессу.
     */
    class CommandThread
    {
    public:
        /**
         * @brief Выполнить fn в новом потоке и дождаться его.
         * @return Код возврата fn; исключение из fn пробрасывается вызывающему.
         */
        static int Run(const std::function<int()> &fn);

        /// true внутри потока, запущенного Run().
        static bool IsCurrent();
    };
} // namespace NetConfig
