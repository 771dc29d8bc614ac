#ifndef IOTHREAD_HPP
#define IOTHREAD_HPP

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio/io_context.hpp>

#include "../interfaces/ILogger.hpp"

// Runs an io_context on its own thread. join() lets queued work finish;
// if join() was never reached the destructor stops the context first.
class IoThread {
public:
    IoThread(boost::asio::io_context& ioc, std::shared_ptr<ILogger> logger)
        : ioc_(ioc), logger_(std::move(logger)) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for IoThread");
        }
        thread_ = std::thread([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                logger_->error("Exception in Boost.Asio I/O thread: " + std::string(e.what()));
            }
        });
    }

    ~IoThread() {
        if (thread_.joinable()) {
            ioc_.stop();
            thread_.join();
        }
    }

    IoThread(const IoThread&) = delete;
    IoThread& operator=(const IoThread&) = delete;

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool joinable() const { return thread_.joinable(); }

private:
    boost::asio::io_context& ioc_;
    std::shared_ptr<ILogger> logger_;
    std::thread thread_;
};

#endif // IOTHREAD_HPP
