#pragma once

#include <notifypipe/error.hpp>
#include <notifypipe/job_state.hpp>

#include <nlohmann/json.hpp>
#include <tinyxml2.h>

#include <cctype>
#include <string>

namespace notifypipe {

    /// Payload encodings
    enum class Format : dp::u8 { Xml = 0, Json = 1 };

    inline const char *to_string(Format format) { return format == Format::Json ? "JSON" : "XML"; }

    /// The HTTP transport's content-type flag for a format
    inline bool content_is_json(Format format) { return format == Format::Json; }

    inline dp::Res<Format> parse_format(std::string_view name) {
        std::string lowered = to_lower(trim(name));
        if (lowered == "json") {
            return dp::result::ok(Format::Json);
        }
        if (lowered == "xml") {
            return dp::result::ok(Format::Xml);
        }
        return dp::result::err(dp::Error::invalid_argument(dp::String("unknown format: ") + std::string(name).c_str()));
    }

    // "queueId" -> "queue_id"
    inline std::string lower_case_with_underscores(std::string_view identifier) {
        std::string out;
        out.reserve(identifier.size() + 4);
        for (char c : identifier) {
            if (std::isupper(static_cast<unsigned char>(c))) {
                if (!out.empty()) {
                    out.push_back('_');
                }
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    namespace detail {

        using OrderedJson = nlohmann::ordered_json;

        // Unset optionals are left out, empty collections are written as [] and {}
        class JsonFieldWriter {
          private:
            OrderedJson &out_;

          public:
            explicit JsonFieldWriter(OrderedJson &out) : out_(out) {}

            void field(const char *name, const std::optional<std::string> &value) {
                if (value) {
                    out_[lower_case_with_underscores(name)] = *value;
                }
            }

            void field(const char *name, dp::i64 value) { out_[lower_case_with_underscores(name)] = value; }

            void field(const char *name, const std::optional<Phase> &value) {
                if (value) {
                    out_[lower_case_with_underscores(name)] = to_string(*value);
                }
            }

            void field(const char *name, const std::vector<std::string> &values) {
                out_[lower_case_with_underscores(name)] = values;
            }

            void field(const char *name, const StringMap &values) {
                out_[lower_case_with_underscores(name)] = values;
            }

            void field(const char *name, const std::map<std::string, StringMap> &values) {
                out_[lower_case_with_underscores(name)] = values;
            }

            template <typename Nested> void field(const char *name, const std::optional<Nested> &nested) {
                if (nested) {
                    OrderedJson child = OrderedJson::object();
                    JsonFieldWriter writer(child);
                    visit_fields(*nested, writer);
                    out_[lower_case_with_underscores(name)] = std::move(child);
                }
            }
        };

        // Returns nullptr when text is well-formed UTF-8 made only of XML 1.0 characters:
        // #x9 | #xA | #xD | [#x20-#xD7FF] | [#xE000-#xFFFD] | [#x10000-#x10FFFF]
        inline const char *invalid_xml_text(std::string_view text) {
            std::size_t i = 0;
            while (i < text.size()) {
                auto lead = static_cast<unsigned char>(text[i]);
                dp::u32 cp = 0;
                std::size_t len = 0;
                if (lead < 0x80) {
                    cp = lead;
                    len = 1;
                } else if ((lead & 0xE0) == 0xC0) {
                    cp = lead & 0x1F;
                    len = 2;
                } else if ((lead & 0xF0) == 0xE0) {
                    cp = lead & 0x0F;
                    len = 3;
                } else if ((lead & 0xF8) == 0xF0) {
                    cp = lead & 0x07;
                    len = 4;
                } else {
                    return "invalid UTF-8 lead byte";
                }
                if (i + len > text.size()) {
                    return "truncated UTF-8 sequence";
                }
                for (std::size_t k = 1; k < len; k++) {
                    auto cont = static_cast<unsigned char>(text[i + k]);
                    if ((cont & 0xC0) != 0x80) {
                        return "invalid UTF-8 continuation byte";
                    }
                    cp = (cp << 6) | (cont & 0x3F);
                }
                // Overlong forms and surrogates are not UTF-8
                if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
                    (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                    return "invalid UTF-8 sequence";
                }
                if ((cp < 0x20 && cp != 0x9 && cp != 0xA && cp != 0xD) || cp == 0xFFFE || cp == 0xFFFF) {
                    return "character not allowed in XML";
                }
                i += len;
            }
            return nullptr;
        }

        // Tag per field, maps as <entry><string>key</string>value</entry>, lists as repeated <string>
        // The first text that cannot go into an XML 1.0 document is kept in error() and stops output.
        class XmlFieldWriter {
          private:
            tinyxml2::XMLPrinter &printer_;
            std::string error_;

            void text_element(const char *tag, const std::string &text) {
                if (!error_.empty()) {
                    return;
                }
                if (const char *reason = invalid_xml_text(text)) {
                    error_ = std::string(reason) + " in <" + tag + ">";
                    return;
                }
                printer_.OpenElement(tag);
                printer_.PushText(text.c_str());
                printer_.CloseElement();
            }

            void entries(const StringMap &values) {
                for (const auto &[key, value] : values) {
                    printer_.OpenElement("entry");
                    text_element("string", key);
                    text_element("string", value);
                    printer_.CloseElement();
                }
            }

          public:
            explicit XmlFieldWriter(tinyxml2::XMLPrinter &printer) : printer_(printer) {}

            const std::string &error() const { return error_; }

            void field(const char *name, const std::optional<std::string> &value) {
                if (value) {
                    text_element(name, *value);
                }
            }

            void field(const char *name, dp::i64 value) { text_element(name, std::to_string(value)); }

            void field(const char *name, const std::optional<Phase> &value) {
                if (value) {
                    text_element(name, to_string(*value));
                }
            }

            void field(const char *name, const std::vector<std::string> &values) {
                printer_.OpenElement(name);
                for (const auto &value : values) {
                    text_element("string", value);
                }
                printer_.CloseElement();
            }

            void field(const char *name, const StringMap &values) {
                printer_.OpenElement(name);
                entries(values);
                printer_.CloseElement();
            }

            void field(const char *name, const std::map<std::string, StringMap> &values) {
                printer_.OpenElement(name);
                for (const auto &[key, inner] : values) {
                    printer_.OpenElement("entry");
                    text_element("string", key);
                    printer_.OpenElement("map");
                    entries(inner);
                    printer_.CloseElement();
                    printer_.CloseElement();
                }
                printer_.CloseElement();
            }

            template <typename Nested> void field(const char *name, const std::optional<Nested> &nested) {
                if (nested) {
                    printer_.OpenElement(name);
                    visit_fields(*nested, *this);
                    printer_.CloseElement();
                }
            }
        };

        inline dp::Res<Message> to_json(const JobState &job) {
            OrderedJson root = OrderedJson::object();
            JsonFieldWriter writer(root);
            visit_fields(job, writer);
            try {
                return dp::result::ok(to_message(root.dump()));
            } catch (const OrderedJson::exception &e) {
                echo::error("json serialization failed: ", e.what());
                return dp::result::err(error::serialization(e.what()));
            }
        }

        inline dp::Res<Message> to_xml(const JobState &job) {
            tinyxml2::XMLPrinter printer;
            printer.OpenElement("jobState");
            XmlFieldWriter writer(printer);
            visit_fields(job, writer);
            printer.CloseElement();

            if (!writer.error().empty()) {
                echo::error("xml serialization failed: ", writer.error().c_str());
                return dp::result::err(error::serialization(writer.error().c_str()));
            }
            if (printer.CStrSize() <= 1) {
                return dp::result::err(error::serialization("empty xml document"));
            }
            // CStrSize() counts the terminating null
            return dp::result::ok(to_message(std::string_view(printer.CStr(), printer.CStrSize() - 1)));
        }

    } // namespace detail

    /// Encode a job snapshot as UTF-8 bytes
    /// XML keeps identifier field names as tags, JSON rewrites them to lower_case_with_underscores keys.
    inline dp::Res<Message> serialize(const JobState &job, Format format) {
        auto res = format == Format::Json ? detail::to_json(job) : detail::to_xml(job);
        if (res.is_ok()) {
            echo::trace("serialized job as ", to_string(format), ", ", res.value().size(), " bytes");
        }
        return res;
    }

} // namespace notifypipe
