//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BrowserMethods.h
// Purpose: browser/* hub methods bound to an externally supplied browser engine
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "toolhub/DispatchRouter.h"
#include "toolhub/JSONRPCTypes.h"

namespace toolhub {

// Interactive element discovered on the current page.
struct PageElement {
    int64_t id{0};
    std::string tag;
    std::string text;
};

//==========================================================================================================
// IBrowserEngine
// Purpose: Page automation backend (headless browser driver). Implementations report failures by throwing.
// Notes:
//   - Calls may arrive from several handler threads; implementations serialize as they need to.
//   - Screenshots are PNG bytes.
//==========================================================================================================
class IBrowserEngine {
public:
    virtual ~IBrowserEngine() = default;

    virtual void Navigate(const std::string& url) = 0;
    virtual std::string CurrentUrl() = 0;
    virtual std::string PageTitle() = 0;
    virtual std::string PageHtml() = 0;
    virtual std::vector<PageElement> Elements() = 0;
    virtual std::vector<unsigned char> CaptureScreenshot() = 0;
    // Same as CaptureScreenshot with element ids drawn over their bounding boxes.
    virtual std::vector<unsigned char> CaptureScreenshotWithOverlays() = 0;
    virtual void Click(const std::string& selector) = 0;
    virtual void Type(const std::string& selector, const std::string& text) = 0;
    virtual JSONValue ExecuteScript(const std::string& script) = 0;
};

// Upper bound on the html returned by browser/getDOM.
constexpr std::size_t MaxDomHtmlBytes = 5000;

// Standard base64 (with padding) via OpenSSL.
std::string Base64Encode(const std::vector<unsigned char>& bytes);

//==========================================================================================================
// RegisterBrowserMethods
// Purpose: Installs browser/navigate, browser/getDOM, browser/click, browser/type, browser/executeScript,
//          browser/screenshot and browser/getAccessibilityTree on the router.
// Notes:
//   - Missing or non-string params answer InvalidParams; engine failures answer InternalError with the
//     action name prefixed ("navigation failed: ...").
//   - browser/getDOM truncates html to MaxDomHtmlBytes and returns the screenshot as a
//     data:image/png;base64 URL (empty when capture fails).
//==========================================================================================================
void RegisterBrowserMethods(DispatchRouter& router, std::shared_ptr<IBrowserEngine> engine);

} // namespace toolhub
