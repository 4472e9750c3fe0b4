/**
 * Captured provider response bodies
 */

#pragma once

#include <string>

namespace pricewatch {
namespace fixtures {

// Au99.99 at 552.30, previous close 550.00
inline const std::string EASTMONEY_GOLD =
    R"({"rc":0,"rt":4,"data":{"f43":55230,"f44":55400,"f45":54980,"f46":55010,"f60":55000,"f170":42}})";

inline const std::string EASTMONEY_NO_DATA = R"({"rc":0,"rt":4,"data":null})";

inline const std::string SINA_GOLD =
    "var hq_str_gds_AU9999=\"Au99.99,552.30,550.00,550.10,554.00,549.80,15:29:59,552.20,552.40,0,0,0,2024-01-08\";\n";

inline const std::string SINA_GOLD_SPARSE =
    "var hq_str_gds_AU9999=\"Au99.99,552.30,,,,,15:29:59,0\";\n";

inline const std::string SINA_GOLD_SHORT = "var hq_str_gds_AU9999=\"Au99.99,552.30,550.00\";\n";

inline const std::string SINA_EMPTY = "var hq_str_gds_AU9999=\"\";\n";

inline const std::string TENCENT_SHORT =
    "v_s_shau9999=\"1~AU9999~AU9999~552.30~2.30~0.42~12345~67890~~\";\n";

// Full quote with prev_close/open at fields 4/5 and high/low at 33/34
inline std::string tencentFullPayload(const std::string& prev_close, const std::string& open,
                                      const std::string& high, const std::string& low,
                                      int field_count = 40) {
    std::string body = "v_shau9999=\"";
    for (int i = 0; i < field_count; ++i) {
        if (i > 0) {
            body += "~";
        }
        switch (i) {
            case 3: body += "552.30"; break;
            case 4: body += prev_close; break;
            case 5: body += open; break;
            case 33: body += high; break;
            case 34: body += low; break;
            default: body += "0"; break;
        }
    }
    body += "\";\n";
    return body;
}

inline const std::string NETEASE_GOLD =
    R"(_ntes_quote_callback({"118AU9999":{"code":"118AU9999","name":"AU9999","price":552.3,"open":550.1,)"
    R"("high":554.0,"low":549.8,"yestclose":550.0,"updown":2.3,"percent":0.004182}});)";

inline const std::string FUNDGZ_ESTIMATE =
    R"(jsonpgz({"fundcode":"161725","name":"Baijiu Index A","jzrq":"2024-01-05","dwjz":"0.8940",)"
    R"("gsz":"0.8897","gszzl":"-0.48","gztime":"2024-01-08 15:00"});)";

inline const std::string FUNDGZ_EMPTY = "jsonpgz();";

inline const std::string FUND_NAV =
    R"({"Datas":{"FCODE":"161725","SHORTNAME":"Baijiu Index A","DWJZ":"0.8940","RZDF":"-0.50",)"
    R"("FSRQ":"2024-01-05"},"ErrCode":0})";

inline const std::string FUND_PORTFOLIO =
    R"({"Datas":{"fundStocks":[{"GPDM":"600519","GPJC":"Kweichow Moutai","JZBL":"15.12"},)"
    R"({"GPDM":"000858","GPJC":"Wuliangye","JZBL":"14.8"}]},"ErrCode":0,"Expansion":"2024-06-30"})";

inline const std::string FUND_PORTFOLIO_NO_STOCKS =
    R"({"Datas":{"fundStocks":null},"ErrCode":0,"Expansion":"2024-06-30"})";

} // namespace fixtures
} // namespace pricewatch
