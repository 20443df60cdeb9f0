#include "http_server.hpp"
#include "request_target.hpp"
#include "../chunk_codec/chunk_codec.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>
#include <exception>
#include <functional>
#include <limits>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

namespace chunkstream
{

    namespace
    {
        constexpr std::size_t MAX_JSON_BODY = 8 * 1024 * 1024;
        const char *SERVER_NAME = "chunkstream";

        std::string to_string(beast::string_view text)
        {
            return std::string(text.data(), text.size());
        }

        struct JsonReply
        {
            http::status status = http::status::ok;
            json body;
        };

        bool is_upload_route(const http::request_parser<http::empty_body> &parser, const RequestTarget &target)
        {
            return parser.get().method() == http::verb::post && target.segments.size() == 3 &&
                   target.segments[0] == "items" && target.segments[2] == "upload";
        }

        /*
           Session handles one HTTP connection. The header is read first so an
           upload body can be streamed through the splitter instead of being
           buffered; every other request is read whole into a string body.
        */
        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, ServiceContext context)
                : socket_(std::move(socket)), ctx_(std::move(context))
            {
            }

            void start()
            {
                doReadHeader();
            }

        private:
            tcp::socket socket_;
            ServiceContext ctx_;
            beast::flat_buffer buffer_;

            std::optional<http::request_parser<http::empty_body>> header_parser_;
            std::optional<http::request_parser<http::string_body>> string_parser_;
            std::optional<http::request_parser<http::buffer_body>> upload_parser_;
            std::shared_ptr<http::response<http::string_body>> res_;

            unsigned version_ = 11;
            bool keep_alive_ = false;
            RequestTarget target_;

            // Upload state
            std::optional<ChunkSplitter> splitter_;
            std::shared_ptr<UploadTransaction> transaction_;
            std::vector<char> body_buffer_;
            std::size_t pending_offset_ = 0;
            std::size_t pending_size_ = 0;

            // Stream state
            StreamResponsePlan plan_;
            std::shared_ptr<RangeStream> range_stream_;
            std::string slice_;
            bool has_more_ = false;
            std::optional<http::response<http::buffer_body>> stream_res_;
            std::optional<http::response_serializer<http::buffer_body>> stream_sr_;

            // Runs work on the worker pool and resumes on the socket's executor.
            void runBlocking(std::function<void()> work, std::function<void(std::exception_ptr)> done)
            {
                auto self = shared_from_this();
                asio::post(*ctx_.workers, [self, work = std::move(work), done = std::move(done)]() mutable {
                    std::exception_ptr error;
                    try
                    {
                        work();
                    }
                    catch (...)
                    {
                        error = std::current_exception();
                    }
                    asio::post(self->socket_.get_executor(), [self, done = std::move(done), error]() {
                        done(error);
                    });
                });
            }

            void doReadHeader()
            {
                header_parser_.emplace();
                header_parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
                string_parser_.reset();
                upload_parser_.reset();

                auto self = shared_from_this();
                http::async_read_header(socket_, buffer_, *header_parser_,
                                        [self](beast::error_code ec, std::size_t) {
                                            self->onHeader(ec);
                                        });
            }

            void onHeader(beast::error_code ec)
            {
                if (ec)
                {
                    if (ec != http::error::end_of_stream && ec != asio::error::connection_reset)
                        MyLogger::warning("Read error: " + ec.message());
                    close();
                    return;
                }

                const auto &req = header_parser_->get();
                version_ = req.version();
                keep_alive_ = req.keep_alive();
                MyLogger::debug(to_string(req.method_string()) + " " + to_string(req.target()));

                try
                {
                    target_ = parse_target(to_string(req.target()));
                }
                catch (const Error &e)
                {
                    keep_alive_ = false;
                    sendError(std::make_exception_ptr(e));
                    return;
                }

                if (is_upload_route(*header_parser_, target_))
                {
                    startUpload();
                    return;
                }

                string_parser_.emplace(std::move(*header_parser_));
                string_parser_->body_limit(MAX_JSON_BODY);
                auto self = shared_from_this();
                http::async_read(socket_, buffer_, *string_parser_,
                                 [self](beast::error_code ec, std::size_t) {
                                     self->onBody(ec);
                                 });
            }

            void onBody(beast::error_code ec)
            {
                if (ec)
                {
                    MyLogger::warning("Read error: " + ec.message());
                    if (ec == http::error::body_limit)
                    {
                        keep_alive_ = false;
                        sendError(std::make_exception_ptr(ValidationError("Request body too large")));
                        return;
                    }
                    close();
                    return;
                }
                route();
            }

            void route()
            {
                const auto &req = string_parser_->get();
                const auto &segments = target_.segments;
                http::verb method = req.method();

                if (!segments.empty() && segments[0] == "stream" && method == http::verb::get)
                {
                    std::optional<std::string> range;
                    auto it = req.find(http::field::range);
                    if (it != req.end())
                        range = to_string(it->value());

                    if (segments.size() == 2)
                    {
                        startStream(segments[1], std::nullopt, range);
                        return;
                    }
                    if (segments.size() == 1)
                    {
                        auto token = target_.param("chunks");
                        if (!token)
                        {
                            sendError(std::make_exception_ptr(ValidationError("Missing 'chunks' query parameter")));
                            return;
                        }
                        startStream(std::nullopt, *token, range);
                        return;
                    }
                }

                if (segments.size() >= 2 && segments[0] == "items")
                {
                    std::string item_id = segments[1];
                    if (segments.size() == 2 && method == http::verb::post)
                    {
                        handleJson([ctx = ctx_, item_id]() {
                            bool created = ctx.pipeline->register_item(item_id);
                            return JsonReply{created ? http::status::created : http::status::ok,
                                             json{{"item_id", item_id}, {"created", created}}};
                        });
                        return;
                    }
                    if (segments.size() == 2 && method == http::verb::delete_)
                    {
                        handleJson([ctx = ctx_, item_id]() {
                            if (!ctx.pipeline->remove_item(item_id))
                                throw NotFoundError("Item " + item_id + " does not exist");
                            return JsonReply{http::status::ok, json{{"item_id", item_id}, {"removed", true}}};
                        });
                        return;
                    }
                    if (segments.size() == 3 && segments[2] == "finalize" && method == http::verb::post)
                    {
                        std::string body = req.body();
                        handleJson([ctx = ctx_, item_id, body]() {
                            std::vector<ChunkRecord> chunks;
                            try
                            {
                                chunks = json::parse(body).at("chunks").get<std::vector<ChunkRecord>>();
                            }
                            catch (const json::exception &e)
                            {
                                throw ValidationError(std::string("Invalid finalize body: ") + e.what());
                            }
                            std::size_t count = ctx.pipeline->finalize_chunks(item_id, chunks);
                            return JsonReply{http::status::ok, json{{"item_id", item_id},
                                                                    {"chunks", count},
                                                                    {"total_size", total_size(chunks)}}};
                        });
                        return;
                    }
                    if (segments.size() == 3 && segments[2] == "chunks" && method == http::verb::get)
                    {
                        std::optional<codec::Mode> mode;
                        auto compress = target_.param("compress");
                        if (compress)
                        {
                            if (*compress == "true")
                                mode = codec::Mode::compressed;
                            else if (*compress == "false")
                                mode = codec::Mode::plain;
                            else
                            {
                                sendError(std::make_exception_ptr(
                                    ValidationError("compress must be 'true' or 'false'")));
                                return;
                            }
                        }
                        handleJson([ctx = ctx_, item_id, mode]() {
                            auto chunks = ctx.pipeline->list_chunks(item_id);
                            return JsonReply{http::status::ok, json{{"item_id", item_id},
                                                                    {"chunks", chunks},
                                                                    {"total_size", total_size(chunks)},
                                                                    {"token", codec::encode(to_refs(chunks), mode)}}};
                        });
                        return;
                    }
                }

                sendJson(http::status::not_found,
                         json{{"error", "not_found"}, {"message", "No route for " + to_string(req.target())}});
            }

            //--------------------------------------------------------------------------
            // JSON request/response

            void handleJson(std::function<JsonReply()> work)
            {
                auto reply = std::make_shared<JsonReply>();
                runBlocking([reply, work = std::move(work)]() { *reply = work(); },
                            [self = shared_from_this(), reply](std::exception_ptr error) {
                                if (error)
                                    self->sendError(error);
                                else
                                    self->sendJson(reply->status, reply->body);
                            });
            }

            void sendError(std::exception_ptr error)
            {
                try
                {
                    std::rethrow_exception(error);
                }
                catch (const Error &e)
                {
                    MyLogger::warning(std::string("Request failed (") + e.category() + "): " + e.what());
                    sendJson(static_cast<http::status>(e.http_status()),
                             json{{"error", e.category()}, {"message", e.what()}});
                }
                catch (const std::exception &e)
                {
                    MyLogger::error(std::string("Internal error: ") + e.what());
                    sendJson(http::status::internal_server_error,
                             json{{"error", "internal_error"}, {"message", e.what()}});
                }
            }

            void sendJson(http::status status, const json &body)
            {
                res_ = std::make_shared<http::response<http::string_body>>(status, version_);
                res_->set(http::field::server, SERVER_NAME);
                res_->set(http::field::content_type, "application/json");
                res_->keep_alive(keep_alive_);
                res_->body() = body.dump();
                res_->prepare_payload();

                auto self = shared_from_this();
                http::async_write(socket_, *res_,
                                  [self](beast::error_code ec, std::size_t) {
                                      self->onResponseWritten(ec);
                                  });
            }

            void onResponseWritten(beast::error_code ec)
            {
                if (ec)
                {
                    MyLogger::warning("Write error: " + ec.message());
                    close();
                    return;
                }
                if (!keep_alive_)
                {
                    close();
                    return;
                }
                doReadHeader();
            }

            void close()
            {
                if (range_stream_)
                    range_stream_->cancel();
                abandonUpload();
                beast::error_code ec;
                socket_.shutdown(tcp::socket::shutdown_send, ec);
            }

            //--------------------------------------------------------------------------
            // Upload: body -> splitter -> backend, one chunk in flight

            void startUpload()
            {
                std::string item_id = target_.segments[1];
                std::string name = target_.param("name").value_or("item_" + item_id);

                upload_parser_.emplace(std::move(*header_parser_));
                upload_parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
                splitter_.emplace(ctx_.pipeline->chunk_size(), ctx_.pipeline->read_size());
                body_buffer_.resize(ctx_.pipeline->read_size());
                pending_offset_ = 0;
                pending_size_ = 0;

                auto pipeline = ctx_.pipeline;
                auto self = shared_from_this();
                runBlocking([self, pipeline, item_id, name]() {
                                self->transaction_ = pipeline->begin(item_id, name);
                                self->transaction_->set_progress_callback(
                                    [item_id](std::uint64_t index, std::uint64_t bytes) {
                                        MyLogger::debug("Item " + item_id + ": chunk " + std::to_string(index) +
                                                        " stored, " + std::to_string(bytes) + " bytes so far");
                                    });
                            },
                            [self](std::exception_ptr error) {
                                if (error)
                                    self->failUpload(error);
                                else
                                    self->feedUpload();
                            });
            }

            void readUploadBody()
            {
                auto &body = upload_parser_->get().body();
                body.data = body_buffer_.data();
                body.size = body_buffer_.size();

                auto self = shared_from_this();
                http::async_read(socket_, buffer_, *upload_parser_,
                                 [self](beast::error_code ec, std::size_t) {
                                     self->onUploadBody(ec);
                                 });
            }

            void onUploadBody(beast::error_code ec)
            {
                if (ec == http::error::need_buffer)
                    ec = {};
                if (ec)
                {
                    MyLogger::warning("Upload body read error: " + ec.message());
                    close();
                    return;
                }
                pending_offset_ = 0;
                pending_size_ = body_buffer_.size() - upload_parser_->get().body().size;
                feedUpload();
            }

            void feedUpload()
            {
                while (pending_offset_ < pending_size_)
                {
                    pending_offset_ += splitter_->feed(body_buffer_.data() + pending_offset_,
                                                       pending_size_ - pending_offset_);
                    if (splitter_->ready())
                    {
                        uploadChunk(splitter_->take());
                        return;
                    }
                }

                if (!upload_parser_->is_done())
                {
                    readUploadBody();
                    return;
                }
                if (splitter_->finish())
                {
                    uploadChunk(splitter_->take());
                    return;
                }
                commitUpload();
            }

            void uploadChunk(Chunk chunk)
            {
                auto transaction = transaction_;
                auto pending = std::make_shared<Chunk>(std::move(chunk));
                auto self = shared_from_this();
                runBlocking([transaction, pending]() { transaction->upload_chunk(*pending); },
                            [self](std::exception_ptr error) {
                                if (error)
                                    self->failUpload(error);
                                else
                                    self->feedUpload();
                            });
            }

            void commitUpload()
            {
                auto transaction = transaction_;
                auto count = std::make_shared<std::size_t>(0);
                auto self = shared_from_this();
                runBlocking([transaction, count]() { *count = transaction->commit(); },
                            [self, transaction, count](std::exception_ptr error) {
                                if (error)
                                {
                                    self->failUpload(error);
                                    return;
                                }
                                self->transaction_.reset();
                                MyLogger::info("Stored " + std::to_string(*count) + " chunks for item " +
                                               transaction->item_id());
                                self->sendJson(http::status::ok,
                                               json{{"item_id", transaction->item_id()},
                                                    {"chunks", *count},
                                                    {"total_size", transaction->bytes_staged()}});
                            });
            }

            void failUpload(std::exception_ptr error)
            {
                abandonUpload();
                // The rest of the body is unread.
                keep_alive_ = false;
                sendError(error);
            }

            // Staged records are discarded on a worker when the last reference goes.
            void abandonUpload()
            {
                if (!transaction_)
                    return;
                auto transaction = std::move(transaction_);
                asio::post(*ctx_.workers, [transaction]() mutable { transaction.reset(); });
            }

            //--------------------------------------------------------------------------
            // Streaming: one slice fetched and written at a time

            void startStream(std::optional<std::string> item_id,
                             std::optional<std::string> token,
                             std::optional<std::string> range)
            {
                auto self = shared_from_this();
                auto ctx = ctx_;
                runBlocking([self, ctx, item_id, token, range]() {
                                std::vector<ChunkRecord> chunks = item_id
                                                                      ? ctx.store->list_chunks(*item_id)
                                                                      : to_records(codec::decode(*token));
                                self->plan_ = ctx.streams->plan(total_size(chunks), range);
                                self->range_stream_ = ctx.streams->open(std::move(chunks), self->plan_);
                            },
                            [self](std::exception_ptr error) {
                                if (error)
                                    self->sendError(error);
                                else
                                    self->writeStreamHeader();
                            });
            }

            void writeStreamHeader()
            {
                stream_res_.emplace(static_cast<http::status>(plan_.status), version_);
                stream_res_->set(http::field::server, SERVER_NAME);
                for (const auto &[name, value] : plan_.headers)
                {
                    stream_res_->set(name, value);
                }
                stream_res_->keep_alive(keep_alive_);
                stream_res_->body().data = nullptr;
                stream_res_->body().size = 0;
                stream_res_->body().more = true;
                stream_sr_.emplace(*stream_res_);

                MyLogger::debug("Streaming bytes " + std::to_string(plan_.start) + "-" + std::to_string(plan_.end) +
                                "/" + std::to_string(plan_.total_size));

                auto self = shared_from_this();
                http::async_write_header(socket_, *stream_sr_,
                                         [self](beast::error_code ec, std::size_t) {
                                             if (ec)
                                             {
                                                 MyLogger::warning("Write error: " + ec.message());
                                                 self->close();
                                                 return;
                                             }
                                             self->fetchNextSlice();
                                         });
            }

            void fetchNextSlice()
            {
                auto self = shared_from_this();
                runBlocking([self]() { self->has_more_ = self->range_stream_->next(self->slice_); },
                            [self](std::exception_ptr error) {
                                if (error)
                                {
                                    self->abortStream(error);
                                    return;
                                }
                                self->writeSlice();
                            });
            }

            void writeSlice()
            {
                auto &body = stream_res_->body();
                if (has_more_)
                {
                    body.data = slice_.data();
                    body.size = slice_.size();
                    body.more = true;
                }
                else
                {
                    body.data = nullptr;
                    body.size = 0;
                    body.more = false;
                }

                auto self = shared_from_this();
                http::async_write(socket_, *stream_sr_,
                                  [self](beast::error_code ec, std::size_t) {
                                      if (ec == http::error::need_buffer)
                                          ec = {};
                                      if (ec)
                                      {
                                          MyLogger::info("Client went away during stream: " + ec.message());
                                          self->close();
                                          return;
                                      }
                                      if (self->stream_sr_->is_done())
                                      {
                                          self->finishStream();
                                          return;
                                      }
                                      self->fetchNextSlice();
                                  });
            }

            void finishStream()
            {
                MyLogger::debug("Stream done: " + std::to_string(range_stream_->chunks_fetched()) + " chunks, " +
                                std::to_string(range_stream_->bytes_emitted()) + " bytes");
                range_stream_.reset();
                stream_sr_.reset();
                stream_res_.reset();
                slice_.clear();
                onResponseWritten({});
            }

            // Headers are already out, so the only signal left is closing the connection.
            void abortStream(std::exception_ptr error)
            {
                try
                {
                    std::rethrow_exception(error);
                }
                catch (const std::exception &e)
                {
                    MyLogger::error(std::string("Stream aborted after ") +
                                    std::to_string(range_stream_->bytes_emitted()) + " bytes: " + e.what());
                }
                close();
            }
        };

    } // namespace

    //------------------------------------------------------------------------------

    class HttpServer::Impl
    {
    public:
        Impl(asio::io_context &ioc,
             const std::string &ip,
             unsigned short port,
             ServiceContext context)
            : ioc_(ioc),
              acceptor_(ioc),
              ctx_(std::move(context))
        {
            if (!ctx_.store || !ctx_.pipeline || !ctx_.streams || !ctx_.workers)
            {
                throw std::invalid_argument("HttpServer needs a store, pipeline, stream handler and worker pool");
            }

            tcp::endpoint endpoint{asio::ip::make_address(ip), port};

            beast::error_code ec;
            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw std::runtime_error("Acceptor open error: " + ec.message());

            acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
            if (ec)
                throw std::runtime_error("Set option error: " + ec.message());

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw std::runtime_error("Bind error on " + ip + ":" + std::to_string(port) + ": " + ec.message());

            acceptor_.listen(asio::socket_base::max_listen_connections, ec);
            if (ec)
                throw std::runtime_error("Listen error: " + ec.message());

            port_ = acceptor_.local_endpoint().port();
            MyLogger::info("HttpServer bound to " + ip + ":" + std::to_string(port_));
        }

        void run()
        {
            doAccept();
        }

        void stop()
        {
            beast::error_code ec;
            acceptor_.close(ec);
        }

        unsigned short port() const
        {
            return port_;
        }

    private:
        asio::io_context &ioc_;
        tcp::acceptor acceptor_;
        ServiceContext ctx_;
        unsigned short port_ = 0;

        void doAccept()
        {
            acceptor_.async_accept(
                asio::make_strand(ioc_),
                [this](beast::error_code ec, tcp::socket socket) {
                    if (ec == asio::error::operation_aborted)
                        return;
                    if (!ec)
                    {
                        std::make_shared<Session>(std::move(socket), ctx_)->start();
                    }
                    else
                    {
                        MyLogger::warning("Accept error: " + ec.message());
                    }
                    doAccept();
                });
        }
    };

    //------------------------------------------------------------------------------

    HttpServer::HttpServer(asio::io_context &ioc,
                           const std::string &ip,
                           unsigned short port,
                           ServiceContext context)
        : impl_(std::make_unique<Impl>(ioc, ip, port, std::move(context)))
    {
    }

    void HttpServer::run()
    {
        impl_->run();
    }

    void HttpServer::stop()
    {
        impl_->stop();
    }

    unsigned short HttpServer::port() const
    {
        return impl_->port();
    }

    HttpServer::~HttpServer() = default;

} // namespace chunkstream
