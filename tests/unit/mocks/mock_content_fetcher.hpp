#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "render/renderer.hpp"

namespace opr {
namespace tests {

using namespace testing;

class MockContentFetcher : public render::IContentFetcher {
public:
    MOCK_METHOD(render::RenderResult, fetch,
                (const std::string &, const std::vector<content::MediaRange> &, const content::RenderContext &,
                 const render::RenderTrace &),
                (override));
};

}  // namespace tests
}  // namespace opr
