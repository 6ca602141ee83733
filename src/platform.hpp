#pragma once

#include <string>
#include <functional>
#include <memory>
#include <filesystem>

namespace semsearch::platform {

    /**
     * @brief Abstract base class for the IPC server (the Bridge).
     *
     * One request per connection: the client writes its request and shuts down
     * its write side; the server replies and closes.
     */
    class Bridge {
    public:
        using MessageCallback = std::function<std::string(const std::string&)>;

        virtual ~Bridge() = default;

        /**
         * @brief Initializes the IPC endpoint.
         * @param name The name of the socket (e.g., "semsearch.sock").
         * @return false if the endpoint could not be created.
         */
        virtual bool listen(const std::string& name) = 0;

        /**
         * @brief Sets the handler for incoming messages. It is called from worker
         * threads and must be thread-safe.
         */
        virtual void set_handler(MessageCallback handler) = 0;

        /**
         * @brief Number of threads serving connections. Set before run().
         */
        virtual void set_workers(size_t workers) = 0;

        /**
         * @brief Runs the accept loop until stop().
         */
        virtual void run() = 0;

        virtual void stop() = 0;

        static std::unique_ptr<Bridge> create();
    };

    /**
     * @brief Abstract base class for the IPC client.
     */
    class Client {
    public:
        virtual ~Client() = default;

        /**
         * @brief Connects to the IPC endpoint.
         * @return true if connected successfully.
         */
        virtual bool connect(const std::string& name) = 0;

        /**
         * @brief Sends a message and waits for the complete response.
         * @return The response, or an empty string on transport failure.
         */
        virtual std::string send(const std::string& message) = 0;

        static std::unique_ptr<Client> create();
    };

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        std::filesystem::path get_config_dir();
        std::filesystem::path get_data_dir();
        bool is_daemon_running(const std::string& name);
    }

}
