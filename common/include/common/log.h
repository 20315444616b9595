#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

#include <sstream>
#include <string>
#include <utility>

namespace common::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error
};

enum class Category
{
    Gcode,
    Io,
    Render,
    App
};

constexpr const char* categoryName(Category category)
{
    switch (category)
    {
    case Category::Gcode: return "gcode";
    case Category::Io: return "io";
    case Category::Render: return "render";
    case Category::App: return "app";
    }
    return "unknown";
}

namespace detail
{

inline QLoggingCategory& categoryHandle(Category category)
{
    switch (category)
    {
    case Category::Gcode: {
        static QLoggingCategory instance("cncviz.gcode");
        return instance;
    }
    case Category::Io: {
        static QLoggingCategory instance("cncviz.io");
        return instance;
    }
    case Category::Render: {
        static QLoggingCategory instance("cncviz.render");
        return instance;
    }
    case Category::App: {
        static QLoggingCategory instance("cncviz.app");
        return instance;
    }
    }
    static QLoggingCategory fallback("cncviz.unknown");
    return fallback;
}

inline QString toMessage(const QString& message)
{
    return message;
}

inline QString toMessage(const char* message)
{
    return message ? QString::fromUtf8(message) : QString();
}

inline QString toMessage(const std::string& message)
{
    return QString::fromStdString(message);
}

template <typename T>
QString toMessage(const T& value)
{
    std::ostringstream stream;
    stream << value;
    return QString::fromStdString(stream.str());
}

} // namespace detail

inline void write(Level level, Category category, const QString& message)
{
    QLoggingCategory& qtCategory = detail::categoryHandle(category);
    switch (level)
    {
    case Level::Debug:
        qCDebug(qtCategory).noquote() << message;
        break;
    case Level::Info:
        qCInfo(qtCategory).noquote() << message;
        break;
    case Level::Warning:
        qCWarning(qtCategory).noquote() << message;
        break;
    case Level::Error:
        qCCritical(qtCategory).noquote() << message;
        break;
    }
}

template <typename Message>
void log(Level level, Category category, Message&& message)
{
    write(level, category, detail::toMessage(std::forward<Message>(message)));
}

} // namespace common::log

#define LOG_DEBUG(category, message)                                                          \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Debug, ::common::log::Category::category,    \
                           (message));                                                        \
    } while (false)

#define LOG_INFO(category, message)                                                           \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Info, ::common::log::Category::category,     \
                           (message));                                                        \
    } while (false)

#define LOG_WARN(category, message)                                                           \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Warning, ::common::log::Category::category,  \
                           (message));                                                        \
    } while (false)

#define LOG_ERR(category, message)                                                            \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Error, ::common::log::Category::category,    \
                           (message));                                                        \
    } while (false)
