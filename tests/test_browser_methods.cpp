//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_browser_methods.cpp
// Purpose: Browser automation hub methods against a scripted engine
//==========================================================================================================

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "toolhub/DispatchRouter.h"
#include "toolhub/capabilities/BrowserMethods.h"
#include "toolhub/errors/Errors.h"

using namespace toolhub;

namespace {

class FakeEngine : public IBrowserEngine {
public:
    void Navigate(const std::string& url) override {
        if (url.rfind("bad://", 0) == 0) {
            throw std::runtime_error("net::ERR_NAME_NOT_RESOLVED");
        }
        current = url;
    }
    std::string CurrentUrl() override { return current; }
    std::string PageTitle() override {
        if (title.empty()) throw std::runtime_error("no title");
        return title;
    }
    std::string PageHtml() override { return html; }
    std::vector<PageElement> Elements() override { return elements; }
    std::vector<unsigned char> CaptureScreenshot() override { return png; }
    std::vector<unsigned char> CaptureScreenshotWithOverlays() override {
        if (overlayFails) throw std::runtime_error("overlay injection failed");
        return png;
    }
    void Click(const std::string& selector) override {
        if (selector == "#missing") throw std::runtime_error("no element matches selector");
        clicked = selector;
    }
    void Type(const std::string& selector, const std::string& text) override {
        typed = selector + "=" + text;
    }
    JSONValue ExecuteScript(const std::string& script) override {
        if (script == "throw") throw std::runtime_error("ReferenceError");
        return JSONValue(static_cast<int64_t>(script.size()));
    }

    std::string current{"about:blank"};
    std::string title{"Example"};
    std::string html{"<html><body>hi</body></html>"};
    std::vector<PageElement> elements{{1, "button", "Submit"}, {2, "a", "Home"}};
    std::vector<unsigned char> png{'P', 'N', 'G'};
    bool overlayFails{false};
    std::string clicked;
    std::string typed;
};

struct BrowserFixture {
    std::shared_ptr<FakeEngine> engine = std::make_shared<FakeEngine>();
    std::unique_ptr<DispatchRouter> router = std::make_unique<DispatchRouter>();

    BrowserFixture() { RegisterBrowserMethods(*router, engine); }

    JSONRPCResponse call(const std::string& method, const std::string& paramsJson = "{}") {
        JSONRPCRequest req(JSONRPCId(static_cast<int64_t>(1)), method, ParseJSON(paramsJson));
        auto resp = router->Handle(req);
        EXPECT_TRUE(resp.has_value());
        return resp.value_or(JSONRPCResponse());
    }

    static const JSONValue::Object& result(const JSONRPCResponse& r) {
        return std::get<JSONValue::Object>(r.result->value);
    }
};

std::string stringField(const JSONValue::Object& obj, const char* key) {
    return std::get<std::string>(FindMember(obj, key)->value);
}

} // namespace

TEST(BrowserMethods, Base64MatchesRfc4648Vectors) {
    auto enc = [](const std::string& s) { return Base64Encode(std::vector<unsigned char>(s.begin(), s.end())); };
    EXPECT_EQ(enc(""), "");
    EXPECT_EQ(enc("f"), "Zg==");
    EXPECT_EQ(enc("fo"), "Zm8=");
    EXPECT_EQ(enc("foo"), "Zm9v");
    EXPECT_EQ(enc("foobar"), "Zm9vYmFy");
}

TEST(BrowserMethods, AllMethodsRegistered) {
    BrowserFixture f;
    for (const char* m : {"browser/navigate", "browser/getDOM", "browser/click", "browser/type",
                          "browser/executeScript", "browser/screenshot", "browser/getAccessibilityTree"}) {
        EXPECT_TRUE(f.router->HasMethod(m)) << m;
    }
}

TEST(BrowserMethods, NavigateAndFailure) {
    BrowserFixture f;
    auto ok = f.call("browser/navigate", "{\"url\":\"https://example.com\"}");
    ASSERT_FALSE(ok.IsError());
    EXPECT_EQ(serializeJSONValue(ok.result.value()), "{\"success\":true,\"url\":\"https://example.com\"}");
    EXPECT_EQ(f.engine->current, "https://example.com");

    auto bad = f.call("browser/navigate", "{\"url\":\"bad://host\"}");
    auto err = errors::rpcErrorFromResponse(bad);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(err->message, "navigation failed: net::ERR_NAME_NOT_RESOLVED");

    auto missing = f.call("browser/navigate");
    EXPECT_EQ(errors::rpcErrorFromResponse(missing)->code, JSONRPCErrorCodes::InvalidParams);
}

TEST(BrowserMethods, GetDomSnapshot) {
    BrowserFixture f;
    f.engine->current = "https://example.com/page";
    auto resp = f.call("browser/getDOM");
    ASSERT_FALSE(resp.IsError());
    const auto& obj = BrowserFixture::result(resp);
    EXPECT_EQ(stringField(obj, "title"), "Example");
    EXPECT_EQ(stringField(obj, "current_url"), "https://example.com/page");
    EXPECT_EQ(stringField(obj, "html"), "<html><body>hi</body></html>");
    EXPECT_EQ(std::get<int64_t>(FindMember(obj, "element_count")->value), 2);
    const auto& elements = std::get<JSONValue::Array>(FindMember(obj, "interactive_elements")->value);
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(serializeJSONValue(*elements[0]), "{\"id\":1,\"tag\":\"button\",\"text\":\"Submit\"}");
    EXPECT_EQ(stringField(obj, "screenshot"), "data:image/png;base64,UE5H");
}

TEST(BrowserMethods, GetDomTruncatesHtmlOnCharacterBoundary) {
    BrowserFixture f;
    // 4999 ASCII bytes followed by a 2-byte sequence straddling the cap
    f.engine->html = std::string(MaxDomHtmlBytes - 1, 'a') + "\xC3\xA9" + std::string(100, 'b');
    auto resp = f.call("browser/getDOM");
    std::string html = stringField(BrowserFixture::result(resp), "html");
    EXPECT_EQ(html.size(), MaxDomHtmlBytes - 1);

    f.engine->html = std::string(MaxDomHtmlBytes + 500, 'z');
    auto plain = f.call("browser/getDOM");
    EXPECT_EQ(stringField(BrowserFixture::result(plain), "html").size(), MaxDomHtmlBytes);
}

TEST(BrowserMethods, GetDomToleratesMissingTitleAndScreenshot) {
    BrowserFixture f;
    f.engine->title.clear();
    f.engine->overlayFails = true;
    auto resp = f.call("browser/getDOM");
    ASSERT_FALSE(resp.IsError());
    const auto& obj = BrowserFixture::result(resp);
    EXPECT_EQ(stringField(obj, "title"), "");
    EXPECT_EQ(stringField(obj, "screenshot"), "");

    f.engine->overlayFails = false;
    f.engine->png.clear();
    auto empty = f.call("browser/getDOM");
    EXPECT_EQ(stringField(BrowserFixture::result(empty), "screenshot"), "");
}

TEST(BrowserMethods, ClickTypeAndScript) {
    BrowserFixture f;
    auto click = f.call("browser/click", "{\"selector\":\"#go\"}");
    EXPECT_EQ(serializeJSONValue(click.result.value()), "{\"success\":true,\"selector\":\"#go\"}");
    EXPECT_EQ(f.engine->clicked, "#go");

    auto missing = f.call("browser/click", "{\"selector\":\"#missing\"}");
    EXPECT_EQ(errors::rpcErrorFromResponse(missing)->message, "click failed: no element matches selector");

    auto type = f.call("browser/type", "{\"selector\":\"#q\",\"text\":\"hello\"}");
    EXPECT_EQ(serializeJSONValue(type.result.value()), "{\"success\":true}");
    EXPECT_EQ(f.engine->typed, "#q=hello");
    auto typeNoText = f.call("browser/type", "{\"selector\":\"#q\"}");
    EXPECT_EQ(errors::rpcErrorFromResponse(typeNoText)->code, JSONRPCErrorCodes::InvalidParams);

    auto script = f.call("browser/executeScript", "{\"script\":\"1+1\"}");
    EXPECT_EQ(serializeJSONValue(script.result.value()), "{\"success\":true,\"result\":3}");
    auto thrown = f.call("browser/executeScript", "{\"script\":\"throw\"}");
    EXPECT_EQ(errors::rpcErrorFromResponse(thrown)->message, "script execution failed: ReferenceError");
}

TEST(BrowserMethods, ScreenshotAndAccessibilityTree) {
    BrowserFixture f;
    auto shot = f.call("browser/screenshot");
    EXPECT_EQ(serializeJSONValue(shot.result.value()), "{\"success\":true,\"screenshot\":\"UE5H\"}");

    auto tree = f.call("browser/getAccessibilityTree");
    const auto& elements = std::get<JSONValue::Array>(FindMember(BrowserFixture::result(tree), "elements")->value);
    EXPECT_EQ(elements.size(), 2u);
}
