#include "dom/formatter.h"

#include <memory>

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "common/file_utils.h"
#include "common/logging.h"
#include "dom/html_document.h"

namespace Markgate::Dom {

using Common::ErrorKind;
using Common::Status;

namespace {

struct XmlDocDeleter {
    void operator()(xmlDocPtr doc) const noexcept { xmlFreeDoc(doc); }
};

} // namespace

Status Formatter::loadOptions(const std::string& path, FormatOptions& out) {
    std::string text;
    Status status = Common::readTextFile(path, text);
    if (!status.isOk()) {
        return status.withContext("Format config");
    }

    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError()) {
        return Status::error(ErrorKind::CONFIG_INVALID, "Format config %s: JSON error at offset %zu: %s",
                             path.c_str(), doc.GetErrorOffset(),
                             rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        return Status::error(ErrorKind::CONFIG_INVALID, "Format config %s: root must be an object", path.c_str());
    }

    FormatOptions options;
    if (doc.HasMember("indent") && doc["indent"].IsBool()) {
        options.indent = doc["indent"].GetBool();
    }
    if (doc.HasMember("removeBlanks") && doc["removeBlanks"].IsBool()) {
        options.remove_blanks = doc["removeBlanks"].GetBool();
    }
    out = options;
    LOG_DEBUG("Format options from %s: indent=%d removeBlanks=%d", path.c_str(),
              out.indent, out.remove_blanks);
    return Status::ok();
}

Status Formatter::loadOptions(const Common::PathGuard& guard, const std::string& path, FormatOptions& out) {
    std::string resolved;
    Status status = guard.validateFile(path, "", resolved);
    if (!status.isOk()) {
        return status;
    }
    return loadOptions(resolved, out);
}

std::string Formatter::format(const std::string& html) const {
    if (html.empty()) {
        return html;
    }

    int parse_options = HtmlDocument::PARSE_OPTIONS;
    if (options_.remove_blanks) {
        parse_options |= HTML_PARSE_NOBLANKS;
    }
    std::unique_ptr<xmlDoc, XmlDocDeleter> doc(
        htmlReadMemory(html.data(), static_cast<int>(html.size()), nullptr, "UTF-8", parse_options));
    if (!doc) {
        LOG_WARN("Formatting failed, keeping unformatted output");
        return html;
    }

    xmlChar* mem = nullptr;
    int size = 0;
    htmlDocDumpMemoryFormat(doc.get(), &mem, &size, options_.indent ? 1 : 0);
    if (!mem || size <= 0) {
        if (mem) xmlFree(mem);
        LOG_WARN("Formatting produced no output, keeping unformatted output");
        return html;
    }
    std::string out(reinterpret_cast<const char*>(mem), static_cast<size_t>(size));
    xmlFree(mem);
    return out;
}

} // namespace Markgate::Dom
