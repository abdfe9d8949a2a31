#pragma once
#include <atomic>
#include <string>
#include "Notifier.hpp"

// Drops every message as an RFC 5322 style text file into a directory, where a
// relay (or a developer) can pick it up. One file per message.
class OutboxNotifier : public Notifier {
public:
    OutboxNotifier(const std::string& dir, const std::string& from);

    DeliveryStatus send(const std::string& to_email,
        const std::string& subject,
        const std::string& body) override;

private:
    std::string outbox_dir;
    std::string from_address;
    std::atomic<unsigned long> sequence{0};
};
