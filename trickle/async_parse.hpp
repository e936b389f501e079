#pragma once

#include <trickle/run.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <beast/core/streambuf.hpp>
#include <cstdint>

namespace trickle
{
    namespace detail
    {
        template <class AsyncReadStream, class Token, class T, class ResultHandler>
        struct async_parse_operation
        {
            typedef parse_outcome<Token, T> outcome_type;

            AsyncReadStream &input;
            ::beast::streambuf &receive_buffer;
            std::size_t read_size;
            ResultHandler on_result;
            input_state<Token> initial;

            async_parse_operation(AsyncReadStream &input, ::beast::streambuf &receive_buffer,
                                  std::size_t const read_size, ResultHandler on_result)
                : input(input)
                , receive_buffer(receive_buffer)
                , read_size(read_size)
                , on_result(std::move(on_result))
                , initial{token_buffer<Token>(), more_input::incomplete}
            {
            }

            std::vector<Token> take_buffered()
            {
                std::vector<Token> buffered;
                buffered.reserve(receive_buffer.size());
                for (auto const &buffer_piece : receive_buffer.data())
                {
                    Token const *const data = boost::asio::buffer_cast<Token const *>(buffer_piece);
                    buffered.insert(buffered.end(), data, data + boost::asio::buffer_size(buffer_piece));
                }
                receive_buffer.consume(receive_buffer.size());
                return buffered;
            }

            // gives the unconsumed input back to whoever reads the stream next
            void restore(token_buffer<Token> const &remaining)
            {
                std::size_t const copied = boost::asio::buffer_copy(
                    receive_buffer.prepare(remaining.size()),
                    boost::asio::buffer(remaining.begin(), remaining.size() * sizeof(Token)));
                receive_buffer.commit(copied);
            }

            void complete(boost::system::error_code const ec, outcome_type outcome)
            {
                on_result(ec, std::move(outcome));
            }
        };

        template <class Operation, class Token>
        void read_more(std::shared_ptr<Operation> operation, prompt_request<Token> request)
        {
            operation->input.async_read_some(
                operation->receive_buffer.prepare(operation->read_size),
                [operation, request](boost::system::error_code const ec, std::size_t const read)
                {
                    if (ec == boost::asio::error::eof)
                    {
                        bounce(request.end_of_stream());
                        return;
                    }
                    if (!!ec)
                    {
                        // the parse is abandoned, so everything it received goes back
                        input_state<Token> const received = add_stream(operation->initial, request.state());
                        operation->restore(received.remaining);
                        operation->complete(ec, typename Operation::outcome_type(failure<Token>{
                                                    received, context_stack{"async-read"}, ec.message()}));
                        return;
                    }
                    if (read == 0)
                    {
                        read_more(operation, request);
                        return;
                    }
                    operation->receive_buffer.commit(read);
                    bounce(request.supply(operation->take_buffered()));
                });
        }
    }

    // Parses from an asio AsyncReadStream. Whatever `receive_buffer` holds is
    // parsed first. Further input is read at most `read_size` bytes at a time
    // until the parser completes. The end of the stream is the end of the
    // input.
    //
    // `on_result` is called exactly once with
    // (boost::system::error_code, parse_outcome<Token, T>). A read error other
    // than eof arrives as the error code together with a failure, and all the
    // input the parse has received is put back into `receive_buffer`.
    // Otherwise the unconsumed input is put back. If the buffered input
    // suffices, `on_result` is called before async_parse returns.
    template <class AsyncReadStream, class Token, class T, class Fallibility, class ResultHandler>
    void async_parse(AsyncReadStream &input, ::beast::streambuf &receive_buffer,
                     parser<Token, T, Fallibility> const &parsed, ResultHandler &&on_result,
                     std::size_t const read_size = 512)
    {
        static_assert(sizeof(Token) == 1, "async_parse reads bytes");
        typedef detail::async_parse_operation<AsyncReadStream, Token, T, typename std::decay<ResultHandler>::type>
            operation_type;
        auto operation = std::make_shared<operation_type>(input, receive_buffer, read_size,
                                                          std::forward<ResultHandler>(on_result));
        operation->initial = make_input_state(operation->take_buffered(), more_input::incomplete);
        run(parsed, prompt<Token>([operation](prompt_request<Token> request)
                                  {
                                      detail::read_more(operation, std::move(request));
                                      return finished();
                                  }),
            operation->initial,
            failure_handler<Token>([operation](failure<Token> failed)
                                   {
                                       operation->restore(failed.remaining.remaining);
                                       operation->complete(boost::system::error_code(),
                                                           typename operation_type::outcome_type(std::move(failed)));
                                       return finished();
                                   }),
            success_handler<Token, T>([operation](input_state<Token> rest, T value)
                                      {
                                          operation->restore(rest.remaining);
                                          operation->complete(boost::system::error_code(),
                                                              typename operation_type::outcome_type(success<Token, T>{
                                                                  std::move(rest), std::move(value)}));
                                          return finished();
                                      }));
    }
}
