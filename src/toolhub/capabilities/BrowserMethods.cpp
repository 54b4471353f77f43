//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BrowserMethods.cpp
// Purpose: browser/* method handlers
//==========================================================================================================

#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <openssl/evp.h>

#include "logging/Logger.h"
#include "toolhub/Protocol.h"
#include "toolhub/capabilities/BrowserMethods.h"

namespace toolhub {

namespace {

std::shared_ptr<JSONValue> str(const std::string& s) { return std::make_shared<JSONValue>(s); }

JSONValue successObject() {
    JSONValue::Object obj;
    obj["success"] = std::make_shared<JSONValue>(true);
    return JSONValue(std::move(obj));
}

JSONValue elementsToJSON(const std::vector<PageElement>& elements) {
    JSONValue::Array arr;
    arr.reserve(elements.size());
    for (const auto& el : elements) {
        JSONValue::Object o;
        o["id"] = std::make_shared<JSONValue>(el.id);
        o["tag"] = str(el.tag);
        o["text"] = str(el.text);
        arr.push_back(std::make_shared<JSONValue>(std::move(o)));
    }
    return JSONValue(std::move(arr));
}

// Cut at most maxBytes without splitting a UTF-8 sequence.
std::string truncateUtf8(const std::string& s, std::size_t maxBytes) {
    if (s.size() <= maxBytes) {
        return s;
    }
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return s.substr(0, cut);
}

template <typename Fn>
auto runAction(const char* action, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        LOG_WARN("Browser: {} failed: {}", action, e.what());
        throw std::runtime_error(fmt::format("{} failed: {}", action, e.what()));
    }
}

} // namespace

std::string Base64Encode(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) {
        return std::string();
    }
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                              static_cast<int>(bytes.size()));
    out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
    return out;
}

void RegisterBrowserMethods(DispatchRouter& router, std::shared_ptr<IBrowserEngine> engine) {
    router.Register("browser/navigate", [engine](const JSONValue::Object& params) {
        const std::string url = RequireString(params, "url");
        runAction("navigation", [&]{ engine->Navigate(url); });
        JSONValue out = successObject();
        std::get<JSONValue::Object>(out.value)["url"] = str(url);
        return out;
    });

    router.Register("browser/getDOM", [engine](const JSONValue::Object&) {
        // Page info is best effort; a page without a title still yields a DOM snapshot
        std::string title;
        std::string html;
        try {
            title = engine->PageTitle();
        } catch (const std::exception& e) {
            LOG_DEBUG("Browser: title unavailable: {}", e.what());
        }
        try {
            html = truncateUtf8(engine->PageHtml(), MaxDomHtmlBytes);
        } catch (const std::exception& e) {
            LOG_DEBUG("Browser: html unavailable: {}", e.what());
        }
        std::vector<PageElement> elements = engine->Elements();

        std::string screenshot;
        try {
            auto png = engine->CaptureScreenshotWithOverlays();
            if (png.empty()) {
                LOG_DEBUG("Browser: screenshot empty");
            } else {
                screenshot = "data:image/png;base64," + Base64Encode(png);
                LOG_DEBUG("Browser: screenshot captured: {} bytes", png.size());
            }
        } catch (const std::exception& e) {
            LOG_WARN("Browser: screenshot error: {}", e.what());
        }

        JSONValue::Object obj;
        obj["title"] = str(title);
        obj["current_url"] = str(engine->CurrentUrl());
        obj["html"] = str(html);
        obj["interactive_elements"] = std::make_shared<JSONValue>(elementsToJSON(elements));
        obj["element_count"] = std::make_shared<JSONValue>(static_cast<int64_t>(elements.size()));
        obj["screenshot"] = str(screenshot);
        return JSONValue(std::move(obj));
    });

    router.Register("browser/click", [engine](const JSONValue::Object& params) {
        const std::string selector = RequireString(params, "selector");
        runAction("click", [&]{ engine->Click(selector); });
        JSONValue out = successObject();
        std::get<JSONValue::Object>(out.value)["selector"] = str(selector);
        return out;
    });

    router.Register("browser/type", [engine](const JSONValue::Object& params) {
        const std::string selector = RequireString(params, "selector");
        const std::string text = RequireString(params, "text");
        runAction("type", [&]{ engine->Type(selector, text); });
        return successObject();
    });

    router.Register("browser/executeScript", [engine](const JSONValue::Object& params) {
        const std::string script = RequireString(params, "script");
        JSONValue result = runAction("script execution", [&]{ return engine->ExecuteScript(script); });
        JSONValue out = successObject();
        std::get<JSONValue::Object>(out.value)["result"] = std::make_shared<JSONValue>(std::move(result));
        return out;
    });

    router.Register("browser/screenshot", [engine](const JSONValue::Object&) {
        auto png = runAction("screenshot", [&]{ return engine->CaptureScreenshot(); });
        JSONValue out = successObject();
        std::get<JSONValue::Object>(out.value)["screenshot"] = str(Base64Encode(png));
        return out;
    });

    router.Register("browser/getAccessibilityTree", [engine](const JSONValue::Object&) {
        JSONValue::Object obj;
        obj["elements"] = std::make_shared<JSONValue>(elementsToJSON(engine->Elements()));
        return JSONValue(std::move(obj));
    });

    LOG_INFO("Browser: methods registered");
}

} // namespace toolhub
