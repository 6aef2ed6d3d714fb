// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Exception classes thrown by the report parsers.
 *
 * The hierarchy follows the usual pattern: av_throwable carries a
 * message and an origin, av_exception is the base of everything a
 * caller is expected to catch, and av_format_exception adds the piece
 * of report text that could not be decoded.
 */

#ifndef AVGEAR_EXCEPTION_HXX
#define AVGEAR_EXCEPTION_HXX 1

#include <exception>
#include <string>

/**
 * Information encapsulating a single location in a raw report.
 *
 * The token index counts whitespace separated groups from zero, the
 * column is the byte offset of that group in the raw text. Either may
 * be -1 when unknown.
 */
class av_location
{
public:
    av_location();
    explicit av_location(int token, int column = -1);

    bool isValid() const { return _token >= 0 || _column >= 0; }
    int getToken() const { return _token; }
    int getColumn() const { return _column; }

    std::string asString() const;

private:
    int _token;
    int _column;
};


/**
 * Abstract base class for all throwables.
 */
class av_throwable : public std::exception
{
public:
    av_throwable();
    explicit av_throwable(const std::string& message, const std::string& origin = {});
    ~av_throwable() noexcept override = default;

    const std::string& getMessage() const { return _message; }
    const std::string& getOrigin() const { return _origin; }
    const std::string getFormattedMessage() const;

    void setMessage(const std::string& message);
    void setOrigin(const std::string& origin);

    const char* what() const noexcept override;

private:
    std::string _message;
    std::string _origin;
    std::string _what;
};


/**
 * Base class for all parser exceptions.
 */
class av_exception : public av_throwable
{
public:
    av_exception() = default;
    explicit av_exception(const std::string& message, const std::string& origin = {});
};


/**
 * A report fragment could not be decoded.
 *
 * The offending text is kept so callers can show it next to the error.
 */
class av_format_exception : public av_exception
{
public:
    av_format_exception() = default;
    av_format_exception(const std::string& message, const std::string& text,
                        const av_location& location = av_location(),
                        const std::string& origin = {});

    const std::string& getText() const { return _text; }
    const av_location& getLocation() const { return _location; }

    /// attach a location once the caller knows where the text came from
    void setLocation(const av_location& location);

private:
    void buildMessage();

    std::string _reason;
    std::string _text;
    av_location _location;
};


/**
 * A value was outside its permitted range (unknown log level name, ...).
 */
class av_range_exception : public av_exception
{
public:
    av_range_exception() = default;
    explicit av_range_exception(const std::string& message, const std::string& origin = {});
};


/**
 * Nothing to parse: the report was empty or only whitespace.
 */
class av_empty_input_exception : public av_exception
{
public:
    explicit av_empty_input_exception(const std::string& origin = {});
};


/**
 * The four letter station identifier is missing or malformed.
 */
class av_missing_station_exception : public av_format_exception
{
public:
    av_missing_station_exception(const std::string& text, const av_location& location,
                                 const std::string& origin = {});
};


/**
 * The mandatory observation or issue time group is missing.
 */
class av_missing_time_exception : public av_format_exception
{
public:
    av_missing_time_exception(const std::string& text, const av_location& location,
                              const std::string& origin = {});
};


/**
 * A time group has the wrong number of digits or an out of range
 * component.
 */
class av_malformed_time_exception : public av_format_exception
{
public:
    av_malformed_time_exception(const std::string& message, const std::string& text,
                                const av_location& location = av_location());
};


/**
 * An optional field token was recognised by its shape but could not be
 * decoded. These are collected on the parsed record rather than thrown
 * out of the parser.
 */
class av_malformed_field_exception : public av_format_exception
{
public:
    av_malformed_field_exception(const std::string& field, const std::string& message,
                                 const std::string& text,
                                 const av_location& location = av_location());

    const std::string& getField() const { return _field; }

private:
    std::string _field;
};

#endif // AVGEAR_EXCEPTION_HXX
