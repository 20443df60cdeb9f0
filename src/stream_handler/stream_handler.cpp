#include "stream_handler.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <algorithm>
#include <charconv>

namespace chunkstream
{

    namespace
    {
        const std::string BYTES_PREFIX = "bytes=";

        // Whole string must be decimal digits.
        bool parse_offset(const std::string &text, std::uint64_t &value)
        {
            if (text.empty())
                return false;
            const char *first = text.data();
            const char *last = first + text.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            return ec == std::errc() && ptr == last;
        }

        std::string trim(const std::string &text)
        {
            auto begin = text.find_first_not_of(" \t");
            if (begin == std::string::npos)
                return "";
            auto end = text.find_last_not_of(" \t");
            return text.substr(begin, end - begin + 1);
        }
    } // namespace

    std::optional<ByteRange> parse_range_header(const std::string &value, std::uint64_t total_size)
    {
        std::string header = trim(value);
        if (total_size == 0 || header.compare(0, BYTES_PREFIX.size(), BYTES_PREFIX) != 0)
        {
            return std::nullopt;
        }

        std::string range_set = trim(header.substr(BYTES_PREFIX.size()));
        if (range_set.find(',') != std::string::npos)
        {
            return std::nullopt;
        }

        auto dash = range_set.find('-');
        if (dash == std::string::npos)
        {
            return std::nullopt;
        }
        std::string first = range_set.substr(0, dash);
        std::string last = range_set.substr(dash + 1);

        ByteRange range;
        if (first.empty())
        {
            // Suffix form: the last n bytes.
            std::uint64_t suffix = 0;
            if (!parse_offset(last, suffix) || suffix == 0)
            {
                return std::nullopt;
            }
            suffix = std::min(suffix, total_size);
            range.start = total_size - suffix;
            range.end = total_size - 1;
            return range;
        }

        if (!parse_offset(first, range.start))
        {
            return std::nullopt;
        }
        if (last.empty())
        {
            range.end = total_size - 1;
        }
        else if (!parse_offset(last, range.end))
        {
            return std::nullopt;
        }

        if (range.start > range.end || range.start >= total_size)
        {
            return std::nullopt;
        }
        range.end = std::min(range.end, total_size - 1);
        return range;
    }

    StreamRequestHandler::StreamRequestHandler(std::shared_ptr<BlobBackendClient> blobs, std::string content_type)
        : blobs_(std::move(blobs)), content_type_(std::move(content_type))
    {
    }

    StreamResponsePlan StreamRequestHandler::plan(std::uint64_t total_size,
                                                  const std::optional<std::string> &range_header) const
    {
        if (total_size == 0)
        {
            throw NotFoundError("No chunks stored for this item");
        }

        StreamResponsePlan plan;
        plan.total_size = total_size;
        plan.start = 0;
        plan.end = total_size - 1;

        if (range_header)
        {
            if (auto range = parse_range_header(*range_header, total_size))
            {
                plan.status = 206;
                plan.start = range->start;
                plan.end = range->end;
            }
            else
            {
                MyLogger::debug("Ignoring unusable Range header: " + *range_header);
            }
        }

        plan.headers.emplace_back("Content-Type", content_type_);
        plan.headers.emplace_back("Accept-Ranges", "bytes");
        plan.headers.emplace_back("Content-Length", std::to_string(plan.content_length()));
        if (plan.partial())
        {
            plan.headers.emplace_back("Content-Range", "bytes " + std::to_string(plan.start) + "-" +
                                                           std::to_string(plan.end) + "/" +
                                                           std::to_string(total_size));
        }
        return plan;
    }

    std::unique_ptr<RangeStream> StreamRequestHandler::open(std::vector<ChunkRecord> chunks,
                                                            const StreamResponsePlan &plan) const
    {
        return std::make_unique<RangeStream>(blobs_, std::move(chunks), plan.start, plan.end);
    }

} // namespace chunkstream
