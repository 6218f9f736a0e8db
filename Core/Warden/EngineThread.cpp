#include "EngineThread.hpp"
#include "Core/Logger.hpp"

EngineThread::~EngineThread()
{
    RequestStop();
    Join_();
}

void EngineThread::Join_()
{
    std::lock_guard<std::mutex> lk(join_mu_);
    if (thread_.joinable())
    {
        thread_.join();
    }
}

bool EngineThread::Start(Body body)
{
    // порядок блокировок: join_mu_, затем stop_mu_
    std::lock_guard<std::mutex> jl(join_mu_);

    std::stop_token token;
    {
        std::lock_guard<std::mutex> sl(stop_mu_);
        if (running_.exchange(true))
        {
            return false;
        }
        stop_ = std::stop_source();
        token = stop_.get_token();
    }

    if (thread_.joinable())
    {
        thread_.join(); // прошлый запуск уже завершился
    }

    result_.store(0);
    thread_ = std::thread([this, body = std::move(body), token]()
       {
           int rc = 1;
           try
           {
               rc = body(token);
           }
           catch (const std::exception &e)
           {
               LOGE("warden") << "Engine terminated: " << e.what();
           }
           result_.store(rc);
           running_.store(false);
       });
    return true;
}

bool EngineThread::RequestStop()
{
    std::lock_guard<std::mutex> lk(stop_mu_);
    if (!running_.load())
    {
        return false;
    }
    stop_.request_stop();
    return true;
}

int EngineThread::Wait()
{
    Join_();
    return result_.load();
}

bool EngineThread::IsRunning() const
{
    return running_.load();
}
