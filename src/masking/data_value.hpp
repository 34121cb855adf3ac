#pragma once

// ---------------------------------------------------------------------------
// data_value.hpp
//
// 쿼리 결과처럼 구조가 정해지지 않은 데이터를 표현하는 재귀 값 타입.
// PII 마스킹 대상이며, yaml_codec 을 통해 YAML/JSON 과 상호 변환된다.
//
// [표현 가능한 값]
// - null, bool, int64, double, string
// - map   : 문자열 키, 삽입 순서 유지 (키 중복 없음)
// - list  : 순서 있는 값의 나열
// - tuple : list 와 같지만 구분되어 보존된다 (마스킹 후에도 tuple 유지)
//
// [설계 원칙]
// - 값 의미론(value semantics). 복사하면 깊은 복사가 일어난다.
// - 잘못된 종류로 접근하면 std::logic_error. 프로그래밍 오류이므로
//   호출자는 kind() 로 먼저 확인해야 한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

class DataValue {
public:
    enum class Kind : std::uint8_t {
        kNull    = 0,
        kBool    = 1,
        kInteger = 2,
        kReal    = 3,
        kString  = 4,
        kMap     = 5,
        kList    = 6,
        kTuple   = 7,
    };

    DataValue() = default;

    [[nodiscard]] static DataValue null();
    [[nodiscard]] static DataValue boolean(bool value);
    [[nodiscard]] static DataValue integer(std::int64_t value);
    [[nodiscard]] static DataValue real(double value);
    [[nodiscard]] static DataValue string(std::string value);
    [[nodiscard]] static DataValue map();
    [[nodiscard]] static DataValue list(std::vector<DataValue> items = {});
    [[nodiscard]] static DataValue tuple(std::vector<DataValue> items = {});

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_null() const noexcept { return kind_ == Kind::kNull; }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == Kind::kString; }
    [[nodiscard]] bool is_map() const noexcept { return kind_ == Kind::kMap; }
    [[nodiscard]] bool is_sequence() const noexcept {
        return kind_ == Kind::kList || kind_ == Kind::kTuple;
    }

    [[nodiscard]] bool               as_bool() const;
    [[nodiscard]] std::int64_t       as_integer() const;
    [[nodiscard]] double             as_real() const;
    [[nodiscard]] const std::string& as_string() const;

    // map: 같은 키가 있으면 값을 교체하고 순서는 유지, 없으면 끝에 추가.
    void set(std::string key, DataValue value);

    // map: 중복 검사 없이 끝에 추가. 키가 아직 없다는 것을 호출자가 보장할
    // 때만 사용한다 (다른 map 을 복제/변환하는 경우). set() 은 키마다 선형
    // 탐색을 하므로 넓은 map 을 만들 때 O(n^2) 이 된다.
    void append_unique(std::string key, DataValue value);

    // map: 키가 없으면 nullptr
    [[nodiscard]] const DataValue* find(std::string_view key) const;

    // list/tuple: 끝에 추가
    void push_back(DataValue value);

    // map 의 키 (삽입 순서). map 이 아니면 빈 벡터.
    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return keys_; }

    // map 의 값 (keys() 와 같은 순서) 또는 list/tuple 의 원소
    [[nodiscard]] const std::vector<DataValue>& items() const noexcept { return items_; }

    // map/list/tuple 의 원소 수. 스칼라는 0.
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

    // 종류/키/원소 순서까지 모두 같아야 같다.
    [[nodiscard]] bool operator==(const DataValue& other) const;

private:
    void require(Kind expected, std::string_view operation) const;

    Kind                     kind_{Kind::kNull};
    bool                     bool_{false};
    std::int64_t             integer_{0};
    double                   real_{0.0};
    std::string              string_{};
    std::vector<std::string> keys_{};   // kMap 전용, items_ 와 같은 길이
    std::vector<DataValue>   items_{};
};

[[nodiscard]] std::string_view data_kind_name(DataValue::Kind kind) noexcept;
