#include "headers.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "../../util/logger.hpp"

namespace tether::http{

    void headers::add_header(std::string key, std::string value){
        if(key.empty()) return;
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void headers::set_header(std::string key, std::string value){
        for(auto & header : headers_)
        {
            if(is_header(header.first, key)){
                header.second = std::move(value);
                return;
            }
        }
        add_header(std::move(key), std::move(value));
    }

    bool headers::remove_header(std::string_view key)
    {
        for(auto it=headers_.begin(); it!=headers_.end(); ++it){
            if(is_header(it->first, key)){
                headers_.erase(it);
                return true;
            }
        }
        return false;
    }

    bool headers::has_header(std::string_view key) const{
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return true;
            }
        }
        return false;
    }

    const std::string& headers::get_header(std::string_view key) const
    {
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return header.second;
            }
        }
        static const std::string empty;
        return empty;
    }

    std::vector<std::string> headers::get_headers_with_key(std::string_view key) const{
        std::vector<std::string> values;
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                values.push_back(header.second);
            }
        }
        return values;
    }

    size_t headers::count_header(std::string_view key) const{
        size_t count = 0;
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)) ++count;
        }
        return count;
    }

    const std::vector<headers::http_header>& headers::get_headers() const{
        return headers_;
    }

    bool headers::empty_headers() const{
        return headers_.empty();
    }

    bool headers::has_connection_token(std::string_view token) const{
        for(const auto & header : headers_)
        {
            if(!is_header(header.first, header::connection)) continue;
            /*
             * Some agents send several directives in a single Connection header, i.e.,
             * keep-alive and upgrade when opening a WebSocket, so test values separately.
             */
            std::vector<std::string> strs;
            boost::split(strs, header.second, boost::is_any_of(","));
            for(auto& str : strs){
                boost::algorithm::trim(str);
                if(is_header(str, token)) return true;
            }
        }
        return false;
    }

    bool headers::has_connection_close() const{
        return has_connection_token(connection_token::close);
    }

    bool headers::keep_alive() const
    {
        if(has_connection_close()) return false;
        if(has_connection_token(connection_token::keep_alive)) return true;
        return http_version_major_ > 1 || (http_version_major_ == 1 && http_version_minor_ >= 1);
    }

    void headers::set_keep_alive(bool keep_alive){
        set_header(header::connection, keep_alive ? connection_token::keep_alive : connection_token::close);
    }

    size_t headers::get_content_length() const{
        const auto& value = get_header(header::content_length);
        if(value.empty()) return 0;
        try{
            return boost::lexical_cast<size_t>(boost::algorithm::trim_copy(value));
        }catch(const boost::bad_lexical_cast &){
            return 0;
        }
    }

    void headers::set_http_version_major(uint8_t http_version_major) {
        http_version_major_ = http_version_major;
    }

    void headers::set_http_version_minor(uint8_t http_version_minor) {
        http_version_minor_ = http_version_minor;
    }

    int headers::get_http_version_major() const {
        return http_version_major_;
    }

    int headers::get_http_version_minor() const {
        return http_version_minor_;
    }

    void headers::log(const char* scope, int level) const{
        LOG_DEBUG("[{}] Headers:", scope);
        for(const auto& t: headers_){
            LOG_DEBUG("  {}: {}", t.first, t.second);
        }
    }

    bool headers::is_header(std::string_view key, std::string_view header){
        return boost::iequals(key, header);
    }

}
