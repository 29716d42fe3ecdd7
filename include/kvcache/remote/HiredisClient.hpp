#pragma once

#include <kvcache/Errors.hpp>
#include <kvcache/remote/IRemoteClient.hpp>
#include <hiredis/hiredis.h>
#include <sys/time.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Клиент Redis на hiredis (синхронный, одно соединение)
 *
 * - Соединение устанавливается в конструкторе, закрывается в деструкторе
 * - Аргументы передаются через *Argv-функции: ключи и значения binary-safe
 * - Таймаут соединения используется и как таймаут команд
 * - Обрыв соединения / нечитаемый ответ: RemoteError
 * - Ответ-ошибка сервера на SET/FLUSHALL: ack == false,
 *   на команды со значением (GET, DEL, MGET, EXISTS): RemoteError
 *
 * Потокобезопасности нет, один экземпляр используется из одного потока.
 */
class HiredisClient : public IRemoteClient {
public:
    HiredisClient(const std::string& host, int port,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(1000))
        : host_(host)
        , port_(port)
    {
        struct timeval tv = toTimeval(timeout);
        context_.reset(redisConnectWithTimeout(host.c_str(), port, tv));
        if (!context_) {
            throw RemoteError("Redis connection error: can't allocate redis context");
        }
        if (context_->err) {
            throw RemoteError("Redis connection error (" + endpoint() + "): " +
                              context_->errstr);
        }
        if (redisSetTimeout(context_.get(), tv) != REDIS_OK) {
            throw RemoteError("Redis connection error (" + endpoint() +
                              "): failed to set command timeout");
        }
    }

    HiredisClient(const HiredisClient&) = delete;
    HiredisClient& operator=(const HiredisClient&) = delete;

    std::optional<std::string> get(const std::string& key) override {
        auto reply = command({"GET", key});
        if (reply->type == REDIS_REPLY_NIL) {
            return std::nullopt;
        }
        if (reply->type == REDIS_REPLY_STRING) {
            return std::string(reply->str, reply->len);
        }
        throw unexpectedReply("GET", reply.get());
    }

    bool set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> expire) override {
        return isOk(command(setArguments({key, value, expire})).get());
    }

    int64_t del(const std::vector<std::string>& keys) override {
        std::vector<std::string> args{"DEL"};
        args.insert(args.end(), keys.begin(), keys.end());

        auto reply = command(args);
        if (reply->type != REDIS_REPLY_INTEGER) {
            throw unexpectedReply("DEL", reply.get());
        }
        return reply->integer;
    }

    std::vector<std::optional<std::string>> mget(
            const std::vector<std::string>& keys) override {
        std::vector<std::string> args{"MGET"};
        args.insert(args.end(), keys.begin(), keys.end());

        auto reply = command(args);
        if (reply->type != REDIS_REPLY_ARRAY) {
            throw unexpectedReply("MGET", reply.get());
        }

        std::vector<std::optional<std::string>> result;
        result.reserve(reply->elements);
        for (size_t i = 0; i < reply->elements; ++i) {
            const redisReply* element = reply->element[i];
            if (element->type == REDIS_REPLY_STRING) {
                result.emplace_back(std::string(element->str, element->len));
            } else {
                result.emplace_back(std::nullopt);
            }
        }
        return result;
    }

    bool exists(const std::string& key) override {
        auto reply = command({"EXISTS", key});
        if (reply->type != REDIS_REPLY_INTEGER) {
            throw unexpectedReply("EXISTS", reply.get());
        }
        return reply->integer > 0;
    }

    bool flushAll() override {
        return isOk(command({"FLUSHALL"}).get());
    }

    /**
     * @brief Конвейер: все команды уходят одной пачкой, затем читаются ответы
     */
    std::vector<bool> pipelineSet(const std::vector<SetCommand>& commands) override {
        for (const auto& cmd : commands) {
            ArgvBuffer argv(setArguments(cmd));
            if (redisAppendCommandArgv(context_.get(), argv.count(),
                                       argv.values(), argv.lengths()) != REDIS_OK) {
                throw connectionError("pipeline SET");
            }
        }

        std::vector<bool> acks;
        acks.reserve(commands.size());
        for (size_t i = 0; i < commands.size(); ++i) {
            void* raw = nullptr;
            if (redisGetReply(context_.get(), &raw) != REDIS_OK || raw == nullptr) {
                throw connectionError("pipeline SET");
            }
            ReplyPtr reply(static_cast<redisReply*>(raw));
            acks.push_back(isOk(reply.get()));
        }
        return acks;
    }

    const std::string& host() const { return host_; }
    int port() const { return port_; }

private:
    struct ContextDeleter {
        void operator()(redisContext* context) const { redisFree(context); }
    };

    struct ReplyDeleter {
        void operator()(redisReply* reply) const { freeReplyObject(reply); }
    };

    using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    /**
     * @brief Массивы argv/argvlen для *Argv-функций hiredis
     */
    class ArgvBuffer {
    public:
        explicit ArgvBuffer(const std::vector<std::string>& args)
            : args_(args)
        {
            for (const auto& arg : args_) {
                values_.push_back(arg.data());
                lengths_.push_back(arg.size());
            }
        }

        int count() const { return static_cast<int>(values_.size()); }
        const char** values() { return values_.data(); }
        const size_t* lengths() const { return lengths_.data(); }

    private:
        std::vector<std::string> args_;
        std::vector<const char*> values_;
        std::vector<size_t> lengths_;
    };

    static std::vector<std::string> setArguments(const SetCommand& cmd) {
        std::vector<std::string> args{"SET", cmd.key, cmd.value};
        if (cmd.expire.has_value()) {
            args.push_back("EX");
            args.push_back(std::to_string(cmd.expire->count()));
        }
        return args;
    }

    static bool isOk(const redisReply* reply) {
        return reply->type == REDIS_REPLY_STATUS &&
               std::string(reply->str, reply->len) == "OK";
    }

    static struct timeval toTimeval(std::chrono::milliseconds timeout) {
        struct timeval tv;
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        return tv;
    }

    ReplyPtr command(const std::vector<std::string>& args) {
        ArgvBuffer argv(args);
        void* raw = redisCommandArgv(context_.get(), argv.count(),
                                     argv.values(), argv.lengths());
        if (raw == nullptr) {
            throw connectionError(args.front());
        }
        return ReplyPtr(static_cast<redisReply*>(raw));
    }

    std::string endpoint() const {
        return host_ + ":" + std::to_string(port_);
    }

    RemoteError connectionError(const std::string& commandName) const {
        std::string reason = context_ && context_->err ? context_->errstr : "no reply";
        return RemoteError("Redis " + commandName + " failed (" + endpoint() + "): " + reason);
    }

    RemoteError unexpectedReply(const std::string& commandName,
                                const redisReply* reply) const {
        if (reply->type == REDIS_REPLY_ERROR) {
            return RemoteError("Redis " + commandName + " error: " +
                               std::string(reply->str, reply->len));
        }
        return RemoteError("Redis " + commandName + ": unexpected reply type " +
                           std::to_string(reply->type));
    }

    std::string host_;
    int port_;
    ContextPtr context_;
};
