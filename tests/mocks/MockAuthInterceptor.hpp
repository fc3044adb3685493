#pragma once

#include "ports/input/IAuthInterceptor.hpp"
#include <gmock/gmock.h>

namespace identity::tests::mocks {

class MockAuthInterceptor : public ports::input::IAuthInterceptor {
public:
    MOCK_METHOD(ports::input::InterceptResult, intercept,
                (const ports::input::InboundCredentials& credentials), (override));
};

} // namespace identity::tests::mocks
