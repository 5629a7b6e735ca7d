#ifndef INSTSHARE_CONNECTION_HPP
#define INSTSHARE_CONNECTION_HPP

#include <asio.hpp>
#include <asio/ts/buffer.hpp>
#include <asio/ts/internet.hpp>
#include <array>
#include <deque>
#include <functional>
#include <memory>

#include "protocol.hpp"
#include "../common/logger.hpp"
#include "../common/serializer.hpp"

/**
 * @brief One framed peer connection of the swarm wire protocol.
 *
 * Frames are [len (uint32, big-endian)][msg_type (uint8)][payload]. Reads are
 * chained as long as the socket stays open; writes are queued so that at most
 * one async_write is outstanding.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using message_handler = std::function<void(Message)>;
    using close_handler = std::function<void()>;

    explicit Connection(asio::io_context& io_context)
        : io_context_(io_context), socket_(io_context) {}

    void set_message_handler(message_handler handler) {
        message_handler_ = std::move(handler);
    }

    void set_close_handler(close_handler handler) {
        close_handler_ = std::move(handler);
    }

    asio::ip::tcp::socket& socket() {
        return socket_;
    }

    asio::io_context& get_io_context() {
        return io_context_;
    }

    void start() {
        read_header();
    }

    void send_message(const Message& msg) {
        asio::post(io_context_,
                   [self = shared_from_this(), msg]() {
                       if (self->closed_) return;
                       bool write_in_progress = !self->write_msgs_.empty();
                       self->write_msgs_.push_back(msg);
                       if (!write_in_progress) {
                           self->do_write_header();
                       }
                   });
    }

    void close() {
        if (closed_) return;
        closed_ = true;
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        write_msgs_.clear();
        if (close_handler_) {
            auto handler = std::move(close_handler_);
            close_handler_ = nullptr;
            handler();
        }
    }

    bool is_open() const { return !closed_ && socket_.is_open(); }

    uint64_t bytes_sent() const { return bytes_sent_; }
    uint64_t bytes_received() const { return bytes_received_; }

private:
    void read_header() {
        asio::async_read(socket_, asio::buffer(read_header_buffer_, HEADER_SIZE),
            [self = shared_from_this()](const asio::error_code& error, size_t) {
                if (error) {
                    if (error != asio::error::eof && error != asio::error::operation_aborted) {
                        LOG_DEBUG("Swarm connection read failed: ", error.message());
                    }
                    self->close();
                    return;
                }
                uint32_t payload_len = Serializer::decode_u32(self->read_header_buffer_.data());
                if (payload_len > MAX_PAYLOAD_SIZE) {
                    LOG_WARN("Dropping peer: frame of ", payload_len, " bytes exceeds limit");
                    self->close();
                    return;
                }
                MessageType msg_type = static_cast<MessageType>(self->read_header_buffer_[sizeof(uint32_t)]);
                self->read_body(payload_len, msg_type);
            });
    }

    void read_body(uint32_t payload_len, MessageType msg_type) {
        read_msg_.type = msg_type;
        read_msg_.payload.resize(payload_len);

        asio::async_read(socket_, asio::buffer(read_msg_.payload),
            [self = shared_from_this()](const asio::error_code& error, size_t bytes_transferred) {
                if (error) {
                    LOG_DEBUG("Error reading body: ", error.message());
                    self->close();
                    return;
                }
                self->bytes_received_ += bytes_transferred + HEADER_SIZE;
                if (self->message_handler_) {
                    self->message_handler_(self->read_msg_);
                }
                if (!self->closed_) {
                    self->read_header();
                }
            });
    }

    void do_write_header() {
        if (write_msgs_.empty()) return;
        const Message& msg = write_msgs_.front();
        Serializer::encode_u32(write_header_buffer_.data(), static_cast<uint32_t>(msg.payload.size()));
        write_header_buffer_[sizeof(uint32_t)] = static_cast<uint8_t>(msg.type);

        asio::async_write(socket_, asio::buffer(write_header_buffer_, HEADER_SIZE),
            [self = shared_from_this()](const asio::error_code& error, size_t) {
                if (!error) {
                    self->do_write_body();
                } else {
                    LOG_DEBUG("Error writing header: ", error.message());
                    self->close();
                }
            });
    }

    void do_write_body() {
        if (write_msgs_.empty()) return;
        const Message& msg = write_msgs_.front();
        asio::async_write(socket_, asio::buffer(msg.payload),
            [self = shared_from_this()](const asio::error_code& error, size_t bytes_transferred) {
                if (error) {
                    LOG_DEBUG("Error writing body: ", error.message());
                    self->close();
                    return;
                }
                self->bytes_sent_ += bytes_transferred + HEADER_SIZE;
                self->write_msgs_.pop_front();
                if (!self->write_msgs_.empty()) {
                    self->do_write_header();
                }
            });
    }

    asio::io_context& io_context_;
    asio::ip::tcp::socket socket_;
    message_handler message_handler_;
    close_handler close_handler_;
    std::array<uint8_t, HEADER_SIZE> read_header_buffer_{};
    std::array<uint8_t, HEADER_SIZE> write_header_buffer_{};
    Message read_msg_;
    std::deque<Message> write_msgs_;
    bool closed_ = false;
    uint64_t bytes_sent_ = 0;
    uint64_t bytes_received_ = 0;
};

#endif //INSTSHARE_CONNECTION_HPP
