#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Per-chunk symbol images written to disk during one encode call.
// Every file saved through this object is removed when it goes out of scope,
// whether the encode finished or threw part way through.
class SymbolScratch {
public:
    explicit SymbolScratch(std::string dir);  // empty dir: save() is a no-op
    ~SymbolScratch();

    SymbolScratch(const SymbolScratch&) = delete;
    SymbolScratch& operator=(const SymbolScratch&) = delete;

    void save(unsigned int index, const cv::Mat& symbol);

    const std::vector<std::string>& files() const { return files_; }

private:
    std::string dir_;
    std::vector<std::string> files_;
};
