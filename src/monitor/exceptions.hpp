//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   exceptions.hpp
 *
 * @brief  Failures reported by the remote API client
 */

#pragma once

#include <cstdint>
#include <exception>
#include <string>


namespace TunnelMonitor {

/**
 *  Base class of all the remote API failures.  The transport level
 *  errors never leave the API client; they are converted into one of
 *  the subclasses below.
 */
class RemoteAPIException : public std::exception
{
  public:
    enum class Kind : uint8_t
    {
        UNAUTHORIZED,
        REMOTE_ERROR,
        UNREACHABLE,
        MALFORMED_PAYLOAD
    };

    RemoteAPIException(const Kind kind, const std::string &err) noexcept
        : kind(kind), errormsg(err)
    {
    }
    virtual ~RemoteAPIException() = default;

    virtual const char *what() const noexcept
    {
        return errormsg.c_str();
    }

    Kind GetKind() const noexcept
    {
        return kind;
    }

    /**
     *  Machine readable name of a Kind, used in the exported snapshot
     */
    static const std::string KindStr(const Kind kind)
    {
        switch (kind)
        {
        case Kind::UNAUTHORIZED:
            return "unauthorized";
        case Kind::REMOTE_ERROR:
            return "remote_error";
        case Kind::UNREACHABLE:
            return "unreachable";
        case Kind::MALFORMED_PAYLOAD:
            return "malformed_payload";
        }
        return "unknown";
    }


  private:
    const Kind kind;
    const std::string errormsg;
};


/**
 *  The credential was rejected (HTTP 401).  The account needs to be
 *  reconfigured.
 */
class Unauthorized : public RemoteAPIException
{
  public:
    Unauthorized(const std::string &err) noexcept
        : RemoteAPIException(Kind::UNAUTHORIZED, err)
    {
    }
};


/**
 *  Any non-200 reply other than 401
 */
class RemoteError : public RemoteAPIException
{
  public:
    RemoteError(const int status,
                const std::string &reason,
                const std::string &body_excerpt) noexcept
        : RemoteAPIException(Kind::REMOTE_ERROR,
                             "HTTP " + std::to_string(status)
                                 + (reason.empty() ? "" : " " + reason)
                                 + (body_excerpt.empty() ? "" : ": " + body_excerpt)),
          status(status), reason(reason), body_excerpt(body_excerpt)
    {
    }

    int GetStatus() const noexcept
    {
        return status;
    }

    const std::string &GetReason() const noexcept
    {
        return reason;
    }

    const std::string &GetBodyExcerpt() const noexcept
    {
        return body_excerpt;
    }

  private:
    const int status;
    const std::string reason;
    const std::string body_excerpt;
};


/**
 *  The request timed out or the connection could not be established
 */
class Unreachable : public RemoteAPIException
{
  public:
    Unreachable(const std::string &err) noexcept
        : RemoteAPIException(Kind::UNREACHABLE, err)
    {
    }
};


/**
 *  A 200 reply which did not contain the expected JSON structure
 */
class MalformedPayload : public RemoteAPIException
{
  public:
    MalformedPayload(const std::string &err) noexcept
        : RemoteAPIException(Kind::MALFORMED_PAYLOAD, err)
    {
    }
};

} // namespace TunnelMonitor
