#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <chrono>

#include "vehicle_state_machine.hpp"

namespace net = boost::asio;

namespace auvctl {

// Drives VehicleStateMachine::tick on a fixed cadence, independent of request
// traffic. Deadlines advance by exactly one interval per tick so the step
// sequence stays monotonic; a ticker that falls far behind resynchronises
// instead of bursting through the backlog.
class SimulationTicker {
public:
    // Beyond this many missed intervals the ticker drops the backlog.
    static constexpr int max_catch_up_ticks = 5;

    SimulationTicker(net::io_context& ioc, VehicleStateMachine& vehicle,
                     std::chrono::milliseconds interval);
    ~SimulationTicker();

    SimulationTicker(const SimulationTicker&) = delete;
    SimulationTicker& operator=(const SimulationTicker&) = delete;

    void start();

    // Safe to call from any thread.
    void stop();

    bool running() const { return running_; }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void schedule();
    void on_tick(const boost::system::error_code& ec);

    net::strand<net::io_context::executor_type> strand_;
    net::steady_timer timer_;
    VehicleStateMachine& vehicle_;
    std::chrono::milliseconds interval_;
    double dt_;
    std::chrono::steady_clock::time_point next_deadline_;
    std::atomic<bool> running_{false};
};

}
