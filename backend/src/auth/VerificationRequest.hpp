#pragma once
#include <string>
#include <ctime>

// One outstanding email verification code per user; keyed by user_id.
struct VerificationRequest {
    std::string user_id;
    int code = 0;              // 10000..99999
    std::time_t expires_at = 0;
};
