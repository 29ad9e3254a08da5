#pragma once

#include "common/logger.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace riglink {

struct Event {
    virtual ~Event() = default;
    virtual std::type_index type() const = 0;
};

template<typename T>
struct TypedEvent : Event {
    std::type_index type() const override { return std::type_index(typeid(T)); }
};

// ============================================================================
// Event Bus
// ============================================================================
//
// Synchronous, typed publish/subscribe. publish() runs the handlers of that
// event type on the calling thread in subscription order. The orchestrator
// publishes only from its strand, so subscribers see one ordered stream.

class EventBus {
    using Handler = std::function<void(const Event&)>;

    struct Slot {
        uint64_t id;
        Handler handler;
    };

    struct Registry {
        std::mutex mutex;
        uint64_t next_id = 1;
        std::unordered_map<std::type_index, std::vector<Slot>> slots;

        void remove(std::type_index type, uint64_t id) {
            std::lock_guard lock(mutex);
            auto it = slots.find(type);
            if (it == slots.end()) return;
            std::erase_if(it->second, [id](const Slot& s) { return s.id == id; });
        }
    };

public:
    // Ends the subscription when destroyed; safe to outlive the bus
    class Subscription {
    public:
        Subscription() = default;
        Subscription(std::weak_ptr<Registry> registry, std::type_index type, uint64_t id)
            : registry_(std::move(registry)), type_(type), id_(id) {}
        ~Subscription() { reset(); }

        Subscription(Subscription&& other) noexcept
            : registry_(std::move(other.registry_)), type_(other.type_), id_(other.id_) {
            other.id_ = 0;
        }

        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                registry_ = std::move(other.registry_);
                type_ = other.type_;
                id_ = other.id_;
                other.id_ = 0;
            }
            return *this;
        }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset() {
            if (id_ == 0) return;
            if (auto registry = registry_.lock()) {
                registry->remove(type_, id_);
            }
            id_ = 0;
        }

    private:
        std::weak_ptr<Registry> registry_;
        std::type_index type_ = std::type_index(typeid(void));
        uint64_t id_ = 0;
    };

    EventBus() : registry_(std::make_shared<Registry>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename E>
    [[nodiscard]] Subscription subscribe(std::function<void(const E&)> handler) {
        auto type = std::type_index(typeid(E));
        std::lock_guard lock(registry_->mutex);
        auto id = registry_->next_id++;
        registry_->slots[type].push_back(Slot{id, [h = std::move(handler)](const Event& e) {
            h(static_cast<const E&>(e));
        }});
        return Subscription(registry_, type, id);
    }

    template<typename E>
    void publish(const E& event) {
        std::vector<Handler> handlers;
        {
            std::lock_guard lock(registry_->mutex);
            auto it = registry_->slots.find(std::type_index(typeid(E)));
            if (it == registry_->slots.end()) return;
            for (const auto& slot : it->second) {
                handlers.push_back(slot.handler);
            }
        }

        // Handlers may subscribe or unsubscribe while running
        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                Logger::get("common.events").error("Handler for {} threw: {}", typeid(E).name(), e.what());
            }
        }
    }

    template<typename E>
    size_t subscriber_count() const {
        std::lock_guard lock(registry_->mutex);
        auto it = registry_->slots.find(std::type_index(typeid(E)));
        return it == registry_->slots.end() ? 0 : it->second.size();
    }

private:
    std::shared_ptr<Registry> registry_;
};

using SubscriptionHandle = EventBus::Subscription;

} // namespace riglink
