#include "http_server/http_server.hpp"
#include "blob_client/blob_client.hpp"
#include "load_config/load_config.hpp"
#include "logger/Mylogger.hpp"
#include <boost/asio.hpp>
#include <iostream>

using namespace chunkstream;

int main(int argc, char *argv[])
{
    if (argc != 2)
    {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 1;
    }

    try
    {
        ServerConfig config = ConfigReader::load_server_config(argv[1]);
        MyLogger::init(config.log_level, config.log_file);

        auto store = std::make_shared<ChunkStore>(config.db_path);
        auto blobs = make_blob_client(config.blob_backend);
        auto pipeline = std::make_shared<ChunkUploadPipeline>(store, blobs, config.chunk_size, config.read_size);
        auto streams = std::make_shared<StreamRequestHandler>(blobs, config.content_type);

        boost::asio::io_context ioc;
        boost::asio::thread_pool workers(config.worker_threads);

        ServiceContext context{store, pipeline, streams, &workers};
        HttpServer server(ioc, config.server_ip, config.server_port, context);
        server.run();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code &, int signal_number) {
            MyLogger::info("Received signal " + std::to_string(signal_number) + ", shutting down");
            server.stop();
            ioc.stop();
        });

        MyLogger::info("Chunk stream server listening on " + config.server_ip + ":" +
                       std::to_string(config.server_port) + " (" + config.blob_backend.type + " backend, " +
                       std::to_string(config.worker_threads) + " workers)");
        ioc.run();

        workers.join();
        MyLogger::info("Server stopped");
    }
    catch (const std::exception &e)
    {
        MyLogger::error(std::string("Fatal: ") + e.what());
        return 1;
    }
    return 0;
}
