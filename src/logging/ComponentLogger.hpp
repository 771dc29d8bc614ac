#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "../interfaces/ILogger.hpp"

// Prefixes every line with "[component] " and forwards to another logger, so
// cache, store and sweeper output can be told apart in one console stream.
class ComponentLogger : public ILogger {
public:
    ComponentLogger(std::string component, std::shared_ptr<ILogger> inner)
        : tag_("[" + std::move(component) + "] "), inner_(std::move(inner)) {
        if (!inner_) {
            throw std::invalid_argument("Inner logger cannot be null for ComponentLogger");
        }
    }

    void info(const std::string& message) override { inner_->info(tag_ + message); }
    void debug(const std::string& message) override { inner_->debug(tag_ + message); }
    void warn(const std::string& message) override { inner_->warn(tag_ + message); }
    void error(const std::string& message) override { inner_->error(tag_ + message); }
    void setup(const std::string& message) override { inner_->setup(tag_ + message); }
    int getLogLevel() override { return inner_->getLogLevel(); }

    const std::string& tag() const { return tag_; }

private:
    std::string tag_;
    std::shared_ptr<ILogger> inner_;
};

inline std::shared_ptr<ILogger> makeComponentLogger(const std::string& component, std::shared_ptr<ILogger> inner) {
    return std::make_shared<ComponentLogger>(component, std::move(inner));
}
