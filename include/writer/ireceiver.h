// ireceiver.h
#pragma once
#include <string>
#include "scrape/scrape_type.h"

// 样本的下游目的地。append 可能被多个抓取线程并发调用。
class IReceiver {
public:
    virtual ~IReceiver() = default;

    virtual const std::string& name() const = 0;
    virtual void append(const ScrapeBatch& batch) = 0;
};
