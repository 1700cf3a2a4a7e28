#include "SerialQueue.hpp"

SerialQueue::~SerialQueue()
{
    // Operations still waiting never run; their handles stay pending.
    m_jobs.clear();
}

void SerialQueue::pump()
{
    if (m_pumping)
        return;

    struct PumpGuard
    {
        bool& flag;
        ~PumpGuard()
        {
            flag = false;
        }
    };

    m_pumping = true;
    PumpGuard guard{m_pumping};

    while (!m_running && !m_jobs.empty())
    {
        auto job = std::move(m_jobs.front());
        m_jobs.pop_front();

        m_running = true;
        job();
    }
}

void SerialQueue::finish()
{
    m_running = false;
    pump();
}
