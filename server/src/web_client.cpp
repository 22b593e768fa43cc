#include "web_client.hpp"

namespace pcdrop {

std::string render_web_client(const TransferMode &mode) {
    std::string page = WEB_CLIENT_TEMPLATE;
    const std::string placeholder = "%MODE%";
    std::string label = mode == TransferMode::Hotspot ? "hotspot / Wi-Fi Direct" : "local network";
    size_t pos = page.find(placeholder);
    if (pos != std::string::npos) {
        page.replace(pos, placeholder.size(), label);
    }
    return page;
}

} // namespace pcdrop
