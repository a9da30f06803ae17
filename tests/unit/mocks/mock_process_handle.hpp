#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "sidecar/i_process_handle.hpp"

namespace tether::tests {

using namespace tether;
using namespace testing;

class MockProcessHandle : public sidecar::IProcessHandle {
public:
    MOCK_METHOD(int, pid, (), (const, override));
    MOCK_METHOD(bool, is_running, (), (const, override));
    MOCK_METHOD(bool, terminate, (int, std::string &), (override));
    MOCK_METHOD(std::optional<sidecar::ExitStatus>, exit_status, (), (const, override));
};

}  // namespace tether::tests
