#include "piecenet/execute_context.hpp"
#include "piecenet/co.hpp"
#include "piecenet/event.hpp"
#include "piecenet/execute_dispatcher.hpp"

namespace piecenet
{

microsecond_t execute_context_t::sleep(microsecond_t us)
{
    auto cur = get_current_time();
    stop_for(us);
    auto now = get_current_time();
    if (now - cur >= us)
        return 0;
    return us - (now - cur);
}

void execute_context_t::stop() { co::coroutine_t::yield(); }

void execute_context_t::stop_for(microsecond_t us)
{
    if (us == make_timespan_full())
    {
        co::coroutine_t::yield();
        return;
    }
    if (timer.id >= 0)
        loop->remove_timer(timer);
    timer = loop->add_timer(make_timer(us, [this]() {
        timer.id = -1;
        start();
    }));
    co::coroutine_t::yield();
    loop->remove_timer(timer);
    timer.id = -1;
}

void execute_context_t::start() { loop->get_dispatcher().add(this, std::function<void()>()); }

void execute_context_t::run(std::function<void()> func)
{
    co = co::coroutine_t::create(std::move(func));
    co->set_execute_context(this);
    start();
}

void execute_context_t::wake_up_thread() { loop->wake_up(); }

void execute_context_t::spawn(event_loop_t &loop, std::function<void()> func)
{
    auto ctx = new execute_context_t();
    ctx->detached = true;
    ctx->set_loop(&loop);
    ctx->run(std::move(func));
    ctx->wake_up_thread();
}

execute_context_t *execute_context_t::current()
{
    auto co = co::coroutine_t::current();
    if (co == nullptr)
        return nullptr;
    return co->get_execute_context();
}

void execute_context_t::on_finish()
{
    auto finished = co;
    co = nullptr;
    if (timer.id >= 0)
    {
        loop->remove_timer(timer);
        timer.id = -1;
    }
    if (detached)
    {
        delete this;
    }
    /// the entry function may hold the owner of this context
    delete finished;
}

execute_context_t::execute_context_t()
    : co(nullptr)
    , loop(nullptr)
    , detached(false)
{
    timer.id = -1;
    timer.timepoint = 0;
}

execute_context_t::~execute_context_t()
{
    if (loop)
    {
        if (timer.id >= 0)
            loop->remove_timer(timer);
        loop->get_dispatcher().cancel(this);
    }
    if (co)
    {
        co->set_execute_context(nullptr);
        if (!co::coroutine_t::in_coroutine(co))
            delete co;
    }
}

} // namespace piecenet
