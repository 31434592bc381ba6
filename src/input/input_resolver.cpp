/**
 * @file input_resolver.cpp
 * @brief Implementation of input expansion and validation
 */

#include <usb_responder/input/input_resolver.h>
#include <usb_responder/core/logging.h>

#include <algorithm>
#include <cctype>
#include <system_error>
#include <unordered_map>

namespace usb_responder {

namespace fs = std::filesystem;

namespace {

auto to_lower(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

class input_collector {
public:
    input_collector(const extension_filter& filter, input_resolution& out)
        : filter_(filter), out_(out) {}

    void add_file(const fs::path& path) {
        if (!filter_.accepts(path)) {
            out_.filtered++;
            UR_LOG_DEBUG(log_category::input,
                "Skipping " + path.filename().string() + " - extension not in filter");
            return;
        }

        auto validated = validate_input_file(path);
        if (!validated.has_value()) {
            skip(path, validated.error());
            return;
        }

        auto name = validated.value().path.filename().string();
        auto [slot, inserted] = names_.try_emplace(name, out_.files.size());
        if (!inserted) {
            // A later file with the same name replaces the earlier one
            auto& previous = out_.files[slot->second];
            UR_LOG_DEBUG(log_category::input,
                "Replacing " + previous.path.string() + " with " +
                validated.value().path.string() + " - duplicate name " + name);
            previous = std::move(validated.value());
            return;
        }

        UR_LOG_INFO(log_category::input, "Added file: " + name);
        out_.files.push_back(std::move(validated.value()));
    }

    void add_directory(const fs::path& directory) {
        std::error_code ec;
        fs::recursive_directory_iterator it(
            directory, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            skip(directory, error{error_code::io_error, ec.message()});
            return;
        }

        // Walk order is unspecified; sort so duplicate-name resolution is stable
        std::vector<fs::path> found;
        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                skip(directory, error{error_code::io_error, ec.message()});
                return;
            }
            std::error_code type_ec;
            if (it->is_regular_file(type_ec)) {
                found.push_back(it->path());
            }
        }
        std::sort(found.begin(), found.end());

        for (const auto& path : found) {
            add_file(path);
        }
    }

    void skip(const fs::path& path, error reason) {
        UR_LOG_WARN(log_category::input,
            "Skipping " + path.string() + " - " + reason.message);
        out_.skipped.push_back(skipped_input{path, std::move(reason)});
    }

private:
    const extension_filter& filter_;
    input_resolution& out_;
    std::unordered_map<std::string, std::size_t> names_;
};

}  // namespace

auto extension_filter::parse(std::string_view list) -> extension_filter {
    extension_filter filter;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto item = trim(list.substr(0, comma));
        if (!item.empty() && item.front() == '.') {
            item.remove_prefix(1);
        }
        if (!item.empty()) {
            filter.extensions_.insert(to_lower(std::string(item)));
        }
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }
    return filter;
}

auto extension_filter::accepts(const fs::path& path) const -> bool {
    if (extensions_.empty()) {
        return true;
    }
    auto ext = path.extension().string();
    if (ext.empty()) {
        return false;
    }
    return extensions_.count(to_lower(ext.substr(1))) > 0;
}

auto validate_input_file(const fs::path& path) -> result<file_input> {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return unexpected(error{error_code::file_not_found, "File does not exist"});
    }
    if (!fs::is_regular_file(status)) {
        return unexpected(error{error_code::not_a_regular_file, "Not a file"});
    }

    auto size = fs::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::io_error, ec.message()});
    }
    if (size == 0) {
        return unexpected(error{error_code::empty_file, "File is empty"});
    }

    auto absolute = fs::absolute(path, ec);
    if (ec) {
        return unexpected(error{error_code::io_error, ec.message()});
    }

    return file_input{absolute.lexically_normal(), static_cast<uint64_t>(size)};
}

auto resolve_inputs(const std::vector<std::string>& arguments, const extension_filter& filter)
    -> input_resolution {
    input_resolution resolution;
    input_collector collector(filter, resolution);

    for (const auto& argument : arguments) {
        fs::path path(argument);
        std::error_code ec;
        auto status = fs::status(path, ec);

        if (!ec && fs::is_directory(status)) {
            collector.add_directory(path);
        } else if (!ec && fs::exists(status)) {
            collector.add_file(path);
        } else {
            collector.skip(path, error{error_code::file_not_found,
                                       "not a valid file or directory"});
        }
    }

    std::stable_sort(resolution.files.begin(), resolution.files.end(),
                     [](const file_input& a, const file_input& b) {
                         return a.path.filename() < b.path.filename();
                     });

    UR_LOG_INFO(log_category::input,
        "Found " + std::to_string(resolution.files.size()) + " files to serve");
    return resolution;
}

}  // namespace usb_responder
