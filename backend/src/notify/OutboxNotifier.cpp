#include "OutboxNotifier.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <spdlog/spdlog.h>

OutboxNotifier::OutboxNotifier(const std::string& dir, const std::string& from)
    : outbox_dir(dir), from_address(from)
{
    spdlog::info("OutboxNotifier writing messages to '{}'", outbox_dir);
}

DeliveryStatus OutboxNotifier::send(const std::string& to_email,
    const std::string& subject,
    const std::string& body)
{
    std::error_code ec;
    std::filesystem::create_directories(outbox_dir, ec);
    if (ec) {
        spdlog::error("Cannot create outbox '{}': {}", outbox_dir, ec.message());
        return DeliveryStatus::Failed;
    }

    std::string name = std::to_string(std::time(nullptr)) + "-" +
        std::to_string(sequence.fetch_add(1)) + ".eml";
    std::filesystem::path file = std::filesystem::path(outbox_dir) / name;

    std::ofstream out(file, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for outbound mail", file.string());
        return DeliveryStatus::Failed;
    }

    out << "From: " << from_address << "\r\n"
        << "To: " << to_email << "\r\n"
        << "Subject: " << subject << "\r\n"
        << "Content-Type: text/plain; charset=utf-8\r\n"
        << "\r\n"
        << body << "\r\n";
    out.flush();

    if (!out) {
        spdlog::error("Failed writing outbound mail '{}'", file.string());
        return DeliveryStatus::Failed;
    }

    spdlog::info("Queued mail for '{}' as '{}'", to_email, file.string());
    return DeliveryStatus::Delivered;
}
