#pragma once

#include <QMetaObject>
#include <QObject>

// Owns a signal/slot connection and disconnects it on destruction.
class ScopedConnection
{
public:
    ScopedConnection() = default;
    explicit ScopedConnection(QMetaObject::Connection connection)
        : m_connection(std::move(connection)) {}

    ~ScopedConnection() { reset(); }

    // Non-copyable
    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    // Move semantics
    ScopedConnection(ScopedConnection&& other) noexcept
        : m_connection(std::move(other.m_connection)) {
        other.m_connection = QMetaObject::Connection();
    }
    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            reset();
            m_connection = std::move(other.m_connection);
            other.m_connection = QMetaObject::Connection();
        }
        return *this;
    }

    void reset() {
        if (m_connection) {
            QObject::disconnect(m_connection);
        }
        m_connection = QMetaObject::Connection();
    }

private:
    QMetaObject::Connection m_connection;
};
