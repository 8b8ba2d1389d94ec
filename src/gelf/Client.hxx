// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "Drain.hxx"
#include "InFlight.hxx"
#include "Message.hxx"
#include "ServerSelector.hxx"
#include "co/Task.hxx"
#include "io/Logger.hxx"

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <span>

class EventLoop;

namespace Gelf {

class DatagramTransport;

class ClientErrorHandler {
public:
	/**
	 * A "safe" log call has failed.  This is invoked once per
	 * failed call.
	 */
	virtual void OnGelfError(std::exception_ptr error) noexcept = 0;
};

/**
 * A client which sends log messages to GELF servers.
 *
 * The methods returning #Co::Task start sending only when the task
 * is awaited.  The "strict" methods Log() and Send() throw on error;
 * the "safe" methods (LogSafe() and the ones named after a level)
 * report errors to the #ClientErrorHandler and return std::nullopt.
 */
class Client final {
	const LLogger logger;

	const Config config;

	ServerSelector selector;

	const std::unique_ptr<DatagramTransport> transport;

	InFlightTracker in_flight;

	DrainController drain;

	ClientErrorHandler *const error_handler;

public:
	/**
	 * Create a client which sends UDP datagrams.
	 *
	 * Throws std::invalid_argument if the #Config is not usable.
	 */
	Client(EventLoop &event_loop, Config _config,
	       ClientErrorHandler *_error_handler=nullptr);

	/**
	 * Create a client which sends datagrams over a custom
	 * transport.
	 */
	Client(EventLoop &event_loop, Config _config,
	       std::unique_ptr<DatagramTransport> _transport,
	       ClientErrorHandler *_error_handler=nullptr);

	~Client() noexcept;

	Client(const Client &) = delete;
	Client &operator=(const Client &) = delete;

	const Config &GetConfig() const noexcept {
		return config;
	}

	const InFlightTracker &GetInFlight() const noexcept {
		return in_flight;
	}

	DrainController::State GetState() const noexcept {
		return drain.GetState();
	}

	bool IsClosed() const noexcept {
		return drain.IsClosed();
	}

	/**
	 * Assemble a #Record with the configured defaults and the
	 * current time.
	 */
	Record MakeRecord(Level level, Message message,
			  Metadata metadata={}) const;

	/**
	 * Send a log message.
	 *
	 * Throws on error.
	 *
	 * @return the number of bytes sent
	 */
	Co::Task<std::size_t> Log(Level level, Message message,
				  Metadata metadata={});

	/**
	 * Send a manually assembled record.
	 *
	 * Throws on error.
	 *
	 * @return the number of bytes sent
	 */
	Co::Task<std::size_t> Send(Record record);

	/**
	 * Like Log(), but never throws.
	 *
	 * @return the number of bytes sent or std::nullopt on error
	 */
	Co::Task<std::optional<std::size_t>> LogSafe(Level level,
						     Message message,
						     Metadata metadata={});

	Co::Task<std::optional<std::size_t>> Emergency(Message message,
						       Metadata metadata={}) {
		return LogSafe(Level::EMERGENCY, std::move(message),
			       std::move(metadata));
	}

	Co::Task<std::optional<std::size_t>> Alert(Message message,
						   Metadata metadata={}) {
		return LogSafe(Level::ALERT, std::move(message),
			       std::move(metadata));
	}

	Co::Task<std::optional<std::size_t>> Critical(Message message,
						      Metadata metadata={}) {
		return LogSafe(Level::CRITICAL, std::move(message),
			       std::move(metadata));
	}

	Co::Task<std::optional<std::size_t>> Error(Message message,
						   Metadata metadata={}) {
		return LogSafe(Level::ERROR, std::move(message),
			       std::move(metadata));
	}

	Co::Task<std::optional<std::size_t>> Warning(Message message,
						     Metadata metadata={}) {
		return LogSafe(Level::WARNING, std::move(message),
			       std::move(metadata));
	}

	Co::Task<std::optional<std::size_t>> Warn(Message message,
						  Metadata metadata={}) {
		return Warning(std::move(message), std::move(metadata));
	}

	Co::Task<std::optional<std::size_t>> Notice(Message message,
						    Metadata metadata={}) {
		return LogSafe(Level::NOTICE, std::move(message),
			       std::move(metadata));
	}

	Co::Task<std::optional<std::size_t>> Info(Message message,
						  Metadata metadata={}) {
		return LogSafe(Level::INFO, std::move(message),
			       std::move(metadata));
	}

	Co::Task<std::optional<std::size_t>> Debug(Message message,
						   Metadata metadata={}) {
		return LogSafe(Level::DEBUG, std::move(message),
			       std::move(metadata));
	}

	/**
	 * Wait until all messages in flight have been sent, then
	 * release the transport.
	 *
	 * Throws #AlreadyClosingError if this was called before (or
	 * after Destroy()).
	 */
	Co::Task<void> Close();

	/**
	 * Release the transport immediately, without waiting for
	 * messages in flight.
	 */
	void Destroy() noexcept {
		drain.Destroy();
	}

private:
	Co::Task<std::size_t> SendPayload(std::span<const std::byte> payload);
	Co::Task<std::size_t> SendDatagram(std::span<const std::byte> datagram,
					   const Endpoint &endpoint);

	void ReleaseTransport() noexcept;
};

} // namespace Gelf
