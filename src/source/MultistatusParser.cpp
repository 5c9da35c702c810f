// Repository: loopcast
// Component: WebDAV Multistatus Parser
// Purpose: 207 Multi-Status XML body → directory entries (libxml2).
// Copyright (c) 2026 Loopcast

#include "loopcast/source/MultistatusParser.hpp"

#include <cstring>

#include <libxml/parser.h>
#include <libxml/tree.h>

#include "loopcast/Errors.hpp"
#include "loopcast/source/WebDavTransport.hpp"

namespace loopcast::source {

namespace {

bool IsDavElement(xmlNodePtr node, const char* local_name) {
  if (node == nullptr || node->type != XML_ELEMENT_NODE) return false;
  if (std::strcmp(reinterpret_cast<const char*>(node->name), local_name) != 0) return false;
  // Some servers omit the namespace declaration; accept those too.
  return node->ns == nullptr ||
         std::strcmp(reinterpret_cast<const char*>(node->ns->href), "DAV:") == 0;
}

xmlNodePtr FindChild(xmlNodePtr parent, const char* local_name) {
  for (xmlNodePtr cur = parent->children; cur != nullptr; cur = cur->next) {
    if (IsDavElement(cur, local_name)) return cur;
  }
  return nullptr;
}

std::string NodeText(xmlDocPtr doc, xmlNodePtr node) {
  if (node == nullptr) return "";
  xmlChar* const val = xmlNodeListGetString(doc, node->children, 1 /* inLine */);
  if (val == nullptr) return "";
  std::string text(reinterpret_cast<const char*>(val));
  xmlFree(val);
  const size_t first = text.find_first_not_of(" \t\r\n");
  const size_t last = text.find_last_not_of(" \t\r\n");
  return first == std::string::npos ? "" : text.substr(first, last - first + 1);
}

// "HTTP/1.1 200 OK" → true for 2xx.
bool IsSuccessStatus(const std::string& status_line) {
  const size_t space = status_line.find(' ');
  if (space == std::string::npos || space + 1 >= status_line.size()) return false;
  return status_line[space + 1] == '2';
}

void ApplyProp(xmlDocPtr doc, xmlNodePtr prop, DavEntry* entry) {
  if (xmlNodePtr type = FindChild(prop, "resourcetype")) {
    if (FindChild(type, "collection") != nullptr) entry->is_collection = true;
  }
  if (xmlNodePtr length = FindChild(prop, "getcontentlength")) {
    const std::string text = NodeText(doc, length);
    if (!text.empty()) {
      try {
        entry->content_length = std::stoll(text);
      } catch (const std::exception&) {
        // Non-numeric length: leave unset.
      }
    }
  }
  if (xmlNodePtr name = FindChild(prop, "displayname")) {
    entry->display_name = NodeText(doc, name);
  }
}

}  // namespace

std::string NormalizeHref(const std::string& href) {
  std::string path = href;
  const size_t scheme = path.find("://");
  if (scheme != std::string::npos) {
    const size_t slash = path.find('/', scheme + 3);
    path = slash == std::string::npos ? "/" : path.substr(slash);
  }
  path = PercentDecode(path);
  while (path.size() > 1 && path.back() == '/') path.pop_back();
  if (path.empty()) path = "/";
  return path;
}

std::vector<DavEntry> ParseMultistatus(const std::string& xml) {
  xmlDocPtr doc = xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "multistatus.xml",
                                nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
  if (doc == nullptr) {
    throw SourceUnavailableError("malformed WebDAV response: not XML");
  }

  xmlNodePtr root = xmlDocGetRootElement(doc);
  if (!IsDavElement(root, "multistatus")) {
    xmlFreeDoc(doc);
    throw SourceUnavailableError("malformed WebDAV response: missing multistatus root");
  }

  std::vector<DavEntry> entries;
  for (xmlNodePtr response = root->children; response != nullptr; response = response->next) {
    if (!IsDavElement(response, "response")) continue;

    xmlNodePtr href = FindChild(response, "href");
    if (href == nullptr) continue;

    DavEntry entry;
    const std::string raw_href = NodeText(doc, href);
    entry.server_path = NormalizeHref(raw_href);
    entry.is_collection = !raw_href.empty() && raw_href.back() == '/';

    bool any_success = false;
    for (xmlNodePtr propstat = response->children; propstat != nullptr;
         propstat = propstat->next) {
      if (!IsDavElement(propstat, "propstat")) continue;
      if (!IsSuccessStatus(NodeText(doc, FindChild(propstat, "status")))) continue;
      any_success = true;
      if (xmlNodePtr prop = FindChild(propstat, "prop")) {
        ApplyProp(doc, prop, &entry);
      }
    }
    if (any_success) entries.push_back(std::move(entry));
  }

  xmlFreeDoc(doc);
  return entries;
}

}  // namespace loopcast::source
