#ifndef CHUNKSTREAM_HTTP_SERVER_HPP
#define CHUNKSTREAM_HTTP_SERVER_HPP

#include <boost/asio.hpp>
#include <memory>
#include <string>
#include "../metadata/chunk_store.hpp"
#include "../stream_handler/stream_handler.hpp"
#include "../upload/upload_pipeline.hpp"

namespace chunkstream
{

    // Services shared by every connection. Blocking work (RocksDB, blob
    // backend calls) runs on workers; sockets stay on the io_context.
    struct ServiceContext
    {
        std::shared_ptr<ChunkStore> store;
        std::shared_ptr<ChunkUploadPipeline> pipeline;
        std::shared_ptr<StreamRequestHandler> streams;
        boost::asio::thread_pool *workers = nullptr;
    };

    // Asynchronous HTTP front end built on Boost.Asio and Boost.Beast.
    //
    //   POST   /items/{id}            register an empty item
    //   DELETE /items/{id}            remove an item and its records
    //   POST   /items/{id}/upload     replace chunks from the raw body (?name=)
    //   POST   /items/{id}/finalize   replace chunks from a client-uploaded list
    //   GET    /items/{id}/chunks     chunk list and token (?compress=true|false)
    //   GET    /stream/{id}           range streaming of a stored item
    //   GET    /stream?chunks=TOKEN   range streaming straight from a token
    class HttpServer
    {
    public:
        // Throws std::runtime_error if the endpoint cannot be bound.
        HttpServer(boost::asio::io_context &ioc,
                   const std::string &ip,
                   unsigned short port,
                   ServiceContext context);

        // Start accepting connections.
        void run();

        // Stop accepting; open sessions finish on their own.
        void stop();

        // Bound port; differs from the requested one when that was 0.
        unsigned short port() const;

        ~HttpServer();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_HTTP_SERVER_HPP
