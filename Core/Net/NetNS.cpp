#include "NetNS.hpp"
#include "Core/Logger.hpp"

#include <fcntl.h>
#include <linux/magic.h>
#include <sched.h>
#include <sys/statfs.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#ifndef NSFS_MAGIC
#define NSFS_MAGIC 0x6e736673
#endif

namespace
{
    thread_local bool t_command_thread = false;
    thread_local bool t_in_netns       = false;
    // Поток не смог вернуться в свой namespace: дальше работать в нём нельзя.
    thread_local bool t_poisoned       = false;

    int OpenCurrentNetNS()
    {
        const std::string path = "/proc/self/task/" + std::to_string(::syscall(SYS_gettid)) + "/ns/net";
        return ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    }

    // Вход в namespace в конструкторе, возврат в Restore() или в деструкторе.
    class NsSwitch
    {
    public:
        NsSwitch(int                target_fd,
                 const std::string &target_path)
        {
            orig_fd_ = OpenCurrentNetNS();
            if (orig_fd_ < 0)
            {
                const int e = errno;
                throw std::runtime_error(std::string("failed to open current netns: ") + std::strerror(e));
            }

            if (::setns(target_fd, CLONE_NEWNET) < 0)
            {
                const int e = errno;
                ::close(orig_fd_);
                throw std::runtime_error("failed to switch to netns " + target_path + ": " + std::strerror(e));
            }

            active_     = true;
            t_in_netns  = true;
            LOGT("netns") << "NsSwitch: entered " << target_path;
        }

        ~NsSwitch()
        {
            if (!active_)
            {
                return;
            }
            active_    = false;
            t_in_netns = false;
            if (::setns(orig_fd_, CLONE_NEWNET) < 0)
            {
                t_poisoned = true;
                LOGE("netns") << "NsSwitch: failed to restore original netns errno=" << errno;
            }
            ::close(orig_fd_);
        }

        void Restore()
        {
            active_    = false;
            t_in_netns = false;

            const int rc = ::setns(orig_fd_, CLONE_NEWNET);
            const int e  = errno;
            ::close(orig_fd_);
            if (rc < 0)
            {
                t_poisoned = true;
                throw std::runtime_error(std::string("failed to restore original netns: ") + std::strerror(e));
            }
            LOGT("netns") << "NsSwitch: restored";
        }

        NsSwitch(const NsSwitch &)            = delete;
        NsSwitch &operator=(const NsSwitch &) = delete;

    private:
        int  orig_fd_ = -1;
        bool active_  = false;
    };
}

namespace NetConfig
{
    bool NetNSOpenError::Missing() const
    {
        return errno_ == ENOENT;
    }

    LinuxNetNS::LinuxNetNS(std::string path,
                           int         fd)
        : path_(std::move(path)), fd_(fd)
    {
    }

    LinuxNetNS::~LinuxNetNS()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            LOGT("netns") << "Close: " << path_;
        }
    }

    std::unique_ptr<LinuxNetNS> LinuxNetNS::Open(const std::string &path)
    {
        LOGD("netns") << "Open: path=" << path;
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
        {
            const int e = errno;
            LOGD("netns") << "Open: failed path=" << path << " errno=" << e;
            throw NetNSOpenError("failed to open netns " + path + ": " + std::strerror(e), e);
        }

        struct statfs st{};
        if (::fstatfs(fd, &st) < 0)
        {
            const int e = errno;
            ::close(fd);
            throw NetNSOpenError("failed to stat netns " + path + ": " + std::strerror(e), e);
        }
        if (st.f_type != static_cast<decltype(st.f_type)>(NSFS_MAGIC) &&
            st.f_type != static_cast<decltype(st.f_type)>(PROC_SUPER_MAGIC))
        {
            ::close(fd);
            throw NetNSOpenError("unknown FS magic on " + path + ", not a network namespace", EINVAL);
        }

        return std::unique_ptr<LinuxNetNS>(new LinuxNetNS(path, fd));
    }

    void LinuxNetNS::Do(const std::function<void(NetNS &)> &fn)
    {
        if (!CommandThread::IsCurrent())
        {
            throw std::logic_error("NetNS::Do called outside of a command thread");
        }
        if (t_in_netns)
        {
            throw std::logic_error("NetNS::Do is not reentrant");
        }
        if (t_poisoned)
        {
            throw std::runtime_error("command thread lost its original netns");
        }

        NsSwitch sw(fd_, path_);
        fn(*this);
        sw.Restore();
    }

    std::unique_ptr<NetNS> LinuxNetNSOpener::Open(const std::string &path)
    {
        return LinuxNetNS::Open(path);
    }

    int CommandThread::Run(const std::function<int()> &fn)
    {
        int                rc = 1;
        std::exception_ptr err;

        std::thread th([&]()
                       {
                           t_command_thread = true;
                           try
                           {
                               rc = fn();
                           }
                           catch (...)
                           {
                               err = std::current_exception();
                           }
                       });
        th.join();

        if (err)
        {
            std::rethrow_exception(err);
        }
        return rc;
    }

    bool CommandThread::IsCurrent()
    {
        return t_command_thread;
    }
} // namespace NetConfig
