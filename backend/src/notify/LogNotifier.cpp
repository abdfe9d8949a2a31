#include "LogNotifier.hpp"
#include <spdlog/spdlog.h>

DeliveryStatus LogNotifier::send(const std::string& to_email,
    const std::string& subject,
    const std::string& body)
{
    spdlog::info("[mail] to='{}' subject='{}' body='{}'", to_email, subject, body);
    return DeliveryStatus::Delivered;
}
