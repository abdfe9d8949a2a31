#pragma once
#include "Notifier.hpp"

// Development notifier: writes the message to the log instead of sending it.
class LogNotifier : public Notifier {
public:
    DeliveryStatus send(const std::string& to_email,
        const std::string& subject,
        const std::string& body) override;
};
