#include "piecenet/epoll.hpp"
#include "piecenet/net_exception.hpp"
#include <glog/logging.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>

namespace piecenet
{
static int to_epoll_events(event_type_t type)
{
    int e = 0;
    if (type & event_type::readable)
        e |= EPOLLIN | EPOLLRDHUP;
    if (type & event_type::writable)
        e |= EPOLLOUT;
    if (type & event_type::error)
        e |= EPOLLERR;
    return e;
}

event_epoll_demultiplexer::event_epoll_demultiplexer()
{
    fd = ::epoll_create1(EPOLL_CLOEXEC);
    if (fd < 0)
    {
        throw net_param_exception("epoll create failed!");
    }
    ev_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (ev_fd < 0)
    {
        ::close(fd);
        throw net_param_exception("eventfd create failed!");
    }
    epoll_event ev;
    ev.events = EPOLLIN | EPOLLET;
    ev.data.fd = ev_fd;
    if (epoll_ctl(fd, EPOLL_CTL_ADD, ev_fd, &ev) != 0)
    {
        ::close(ev_fd);
        ::close(fd);
        throw net_param_exception("register eventfd failed!");
    }
}

event_epoll_demultiplexer::~event_epoll_demultiplexer()
{
    ::close(ev_fd);
    ::close(fd);
}

void event_epoll_demultiplexer::update(handle_t handle, event_type_t old_type, event_type_t new_type)
{
    epoll_event ev;
    ev.events = to_epoll_events(new_type) | EPOLLET;
    ev.data.fd = handle;
    int ret;
    if (old_type == 0)
        ret = epoll_ctl(fd, EPOLL_CTL_ADD, handle, &ev);
    else if (new_type == 0)
        ret = epoll_ctl(fd, EPOLL_CTL_DEL, handle, &ev);
    else
        ret = epoll_ctl(fd, EPOLL_CTL_MOD, handle, &ev);
    if (ret != 0)
    {
        VLOG(2) << "epoll_ctl on " << handle << " failed, errno " << errno;
    }
}

void event_epoll_demultiplexer::add(handle_t handle, event_type_t type)
{
    lock::lock_guard g(lock);
    auto &cur = registered[handle];
    auto next = cur | type;
    if (next != cur)
        update(handle, cur, next);
    cur = next;
}

handle_t event_epoll_demultiplexer::select(event_type_t *type, microsecond_t *timeout)
{
    int ms;
    if (*timeout == make_timespan_full())
        ms = -1;
    else
    {
        auto v = (*timeout + 999) / 1000;
        ms = v > 0x7FFFFFFF ? 0x7FFFFFFF : (int)v;
    }

    epoll_event ev;
    int c = ::epoll_wait(fd, &ev, 1, ms);
    if (c <= 0)
    {
        *timeout = 0;
        return 0;
    }
    if (ev.data.fd == ev_fd)
    {
        u64 val;
        while (::read(ev_fd, &val, sizeof(val)) > 0)
        {
        }
        return 0;
    }

    event_type_t t = 0;
    if (ev.events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP))
        t |= event_type::readable;
    if (ev.events & EPOLLOUT)
        t |= event_type::writable;
    if (ev.events & EPOLLERR)
        t |= event_type::error;
    *type = t;
    return ev.data.fd;
}

void event_epoll_demultiplexer::remove(handle_t handle, event_type_t type)
{
    lock::lock_guard g(lock);
    auto it = registered.find(handle);
    if (it == registered.end())
        return;
    auto next = it->second & ~type;
    if (next != it->second)
        update(handle, it->second, next);
    if (next == 0)
        registered.erase(it);
    else
        it->second = next;
}

void event_epoll_demultiplexer::wake_up()
{
    u64 val = 1;
    if (::write(ev_fd, &val, sizeof(val)) < 0 && errno != EAGAIN)
    {
        LOG(WARNING) << "failed to wake up event loop, errno " << errno;
    }
}

} // namespace piecenet
