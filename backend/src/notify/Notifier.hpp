#pragma once
#include <string>

enum class DeliveryStatus {
    Delivered,
    Failed,
    Timeout
};

// Outbound email collaborator.
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual DeliveryStatus send(const std::string& to_email,
        const std::string& subject,
        const std::string& body) = 0;
};
