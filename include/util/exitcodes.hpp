#pragma once

namespace exitc
{
constexpr int ok                  = 0;
constexpr int failure             = 1;  // an operation failed or a device was not found
constexpr int bad_args            = 2;  // usage / validation errors, nothing touched the bus
constexpr int adapter_unavailable = 3;
constexpr int interrupted         = 130;
}  // namespace exitc
