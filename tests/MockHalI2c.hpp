/*****************************************************************
 * File:      MockHalI2c.hpp
 * Category:  tests
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    In-memory I2C transport for host tests. Records every write
 *    as one transaction and can inject open, write and close
 *    failures.
 *****************************************************************/

#ifndef MONOLED_TESTS_MOCK_HAL_I2C_HPP_
#define MONOLED_TESTS_MOCK_HAL_I2C_HPP_

#include "HAL/IHalI2c.hpp"
#include <string>
#include <vector>

namespace monoled::test{

using Transaction = std::vector<uint8_t>;

/** Bus traffic shared by the opener and the devices it creates */
struct MockBusRecord{
  std::vector<Transaction> writes;
  int open_count = 0;
  int close_count = 0;
  hal::i2c_addr_t last_address = 0;

  // Failure injection
  int fail_write_at = -1;                      // nth write on a device, -1 = never
  hal::HalResult open_result = hal::HalResult::OK;
  bool fail_close = false;
};

class MockI2cDevice : public hal::IHalI2cDevice{
private:
  MockBusRecord* record_;
  hal::i2c_addr_t address_;
  bool open_ = true;
  std::string last_error_;
  int attempts_ = 0;

public:
  MockI2cDevice(MockBusRecord* record, hal::i2c_addr_t address)
    : record_(record), address_(address){}

  hal::HalResult write(const uint8_t* data, size_t length) override{
    if(!open_) return hal::HalResult::INVALID_STATE;
    if(!data || length == 0) return hal::HalResult::INVALID_PARAM;

    if(attempts_++ == record_->fail_write_at){
      last_error_ = "mock: remote I/O error";
      return hal::HalResult::WRITE_FAILED;
    }

    record_->writes.emplace_back(data, data + length);
    return hal::HalResult::OK;
  }

  hal::HalResult close() override{
    if(!open_) return hal::HalResult::INVALID_STATE;
    open_ = false;
    record_->close_count++;

    if(record_->fail_close){
      last_error_ = "mock: close failed";
      return hal::HalResult::CLOSE_FAILED;
    }
    return hal::HalResult::OK;
  }

  bool isOpen() const override{ return open_; }
  hal::i2c_addr_t getAddress() const override{ return address_; }
  const char* getLastErrorMessage() const override{ return last_error_.c_str(); }
};

class MockI2cOpener : public hal::IHalI2cOpener{
private:
  MockBusRecord* record_;
  std::string last_error_;

public:
  explicit MockI2cOpener(MockBusRecord* record) : record_(record){}

  hal::HalResult open(hal::i2c_addr_t address, std::unique_ptr<hal::IHalI2cDevice>& device) override{
    record_->open_count++;
    record_->last_address = address;

    if(record_->open_result != hal::HalResult::OK){
      last_error_ = "mock: no such device";
      return record_->open_result;
    }

    device.reset(new MockI2cDevice(record_, address));
    return hal::HalResult::OK;
  }

  const char* getLastErrorMessage() const override{ return last_error_.c_str(); }
};

} // namespace monoled::test

#endif // MONOLED_TESTS_MOCK_HAL_I2C_HPP_
