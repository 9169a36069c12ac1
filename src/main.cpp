#include <string>
#include <iostream>
#include <thread>
#include <chrono>
#include <memory>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "ConfigurationManager.hpp"
#include "FeedSource.hpp"
#include "PredictionStore.hpp"
#include "Presenter.hpp"
#include "Dashboard.hpp"
#include "VirtualClock.hpp"

boost::asio::awaitable<void> runPollingLoop(PredictionStore& store, boost::asio::io_context& io, std::chrono::seconds interval)
{
    boost::asio::steady_timer timer(io);

    for (;;)
    {
        co_await store.refresh();

        timer.expires_after(interval);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

boost::asio::awaitable<void> handleHttpClient(std::shared_ptr<boost::asio::ip::tcp::socket> socket, std::vector<Departure> const& departures, PredictionStore const& store, Presenter const& presenter)
{
    try
    {
        boost::asio::streambuf buffer;

        co_await boost::asio::async_read_until(*socket, buffer, "\r\n\r\n", boost::asio::use_awaitable);

        std::string html = Dashboard::generate(departures, store, presenter);

        std::string response =
            "HTTP/1.1 200 OK\r\n"
            "Content-Type: text/html\r\n"
            "Content-Length: " + std::to_string(html.size()) + "\r\n"
            "Connection: close\r\n\r\n" +
            html;

        co_await boost::asio::async_write(*socket, boost::asio::buffer(response), boost::asio::use_awaitable);

        boost::system::error_code ignore;
        socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    }
    catch (boost::system::system_error const& e)
    {
        auto code = e.code();
        if (code == boost::asio::error::operation_aborted ||
            code == boost::asio::error::connection_reset ||
            code == boost::asio::error::connection_aborted ||
            code == boost::asio::error::eof)
        {
            co_return;
        }

        std::cerr << "HTTP handler error: " << e.what() << "\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "HTTP handler error: " << e.what() << "\n";
    }
}

boost::asio::awaitable<void> httpAcceptLoop(boost::asio::ip::tcp::acceptor& acceptor, std::vector<Departure> const& departures, PredictionStore const& store, Presenter const& presenter)
{
    for (;;)
    {
        auto socket = std::make_shared<boost::asio::ip::tcp::socket>(co_await boost::asio::this_coro::executor);

        co_await acceptor.async_accept(*socket, boost::asio::use_awaitable);
        boost::asio::co_spawn(socket->get_executor(), handleHttpClient(socket, departures, store, presenter), boost::asio::detached);
    }
}

void runHttpServer(unsigned short port, std::vector<Departure> const& departures, PredictionStore const& store, Presenter const& presenter)
{
    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::acceptor acceptor(ioc, {boost::asio::ip::tcp::v4(), port});

        std::cout << "   -> Dashboard active at http://localhost:" << port << "\n";

        boost::asio::co_spawn(ioc, httpAcceptLoop(acceptor, departures, store, presenter), boost::asio::detached);

        ioc.run();
    }
    catch (std::exception const& e)
    {
        std::cerr << "Server Error: " << e.what() << std::endl;
    }
}

void printDepartures(std::vector<Departure> const& departures, PredictionStore const& store, Presenter const& presenter)
{
    std::time_t now = VirtualClock::now();

    for (const auto& d : departures)
    {
        DepartureView view = presenter.present(store.get(d.route, d.stopId), now);

        std::cout << d.name << "\n";
        for (const auto& attr : Presenter::attributes(d, view))
            std::cout << "   " << attr.first << ": " << attr.second << "\n";
    }
}

void parseCommandLineArgs(int argc, char* argv[], std::string& departuresPath, unsigned short& port, bool& once)
{
    departuresPath = "data/departures.txt";
    port = 8080;
    once = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--departures" && i + 1 < argc)
        {
            departuresPath = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc)
        {
            port = static_cast<unsigned short>(std::stoul(argv[++i]));
        }
        else if (arg == "--once")
        {
            once = true;
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }
}

int main(int argc, char* argv[])
{
    try
    {
        std::string departuresPath;
        unsigned short port = 0;
        bool once = false;

        parseCommandLineArgs(argc, argv, departuresPath, port, once);

        ConfigurationManager config(departuresPath);
        Presenter presenter(config.getTimeZone());

        boost::asio::io_context io;
        std::unique_ptr<FeedSource> vehicles;
        if (!config.getVehiclePositionUrl().empty())
            vehicles = makeFeedSource(io, config.getVehiclePositionUrl(), config.getHeaders(), config.getRequestTimeout());

        PredictionStore store(makeFeedSource(io, config.getTripUpdateUrl(), config.getHeaders(), config.getRequestTimeout()),
                              std::move(vehicles),
                              config.getMinRefreshInterval());

        std::cout << "System Initialized.\n";

        if (once)
        {
            boost::asio::co_spawn(io, store.refresh(), boost::asio::detached);
            io.run();
            printDepartures(config.getDepartures(), store, presenter);
            return 0;
        }

        std::thread serverThread([port, &config, &store, &presenter]()
        {
            runHttpServer(port, config.getDepartures(), store, presenter);
        });
        serverThread.detach();

        boost::asio::co_spawn(io, runPollingLoop(store, io, config.getPollInterval()), boost::asio::detached);

        io.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
