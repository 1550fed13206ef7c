#include <modelflow/preprocess/mold.hpp>
#include <modelflow/core/overloaded.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace modelflow::preprocess {

using core::WorkflowError;

namespace {

/// Recode an incoming factor onto the training levels.
std::expected<data::FactorColumn, WorkflowError> conform_levels(
    const data::FactorColumn& training,
    const data::FactorColumn& incoming,
    bool allow_novel_levels) {
  data::FactorColumn out;
  out.levels = training.levels;
  out.codes.reserve(incoming.codes.size());
  for (const auto code : incoming.codes) {
    if (code < 0) {
      out.codes.push_back(-1);
      continue;
    }
    const auto& label = incoming.levels[static_cast<std::size_t>(code)];
    const auto it = std::find(out.levels.begin(), out.levels.end(), label);
    if (it == out.levels.end()) {
      if (!allow_novel_levels) {
        return std::unexpected(WorkflowError::NovelLevel);
      }
      out.codes.push_back(-1);
      continue;
    }
    out.codes.push_back(static_cast<std::int32_t>(it - out.levels.begin()));
  }
  return out;
}

/// Encode resolved terms of data into a design table. When ptype is non-null
/// factor columns are first conformed to its levels.
std::expected<data::Table, WorkflowError> encode_terms(
    const std::vector<Term>& terms,
    const FormulaBlueprint& blueprint,
    const data::Table& data,
    const data::Table* ptype) {
  data::Table out;
  const std::size_t n = data.rows();

  if (blueprint.intercept) {
    auto added = out.add_column(data::make_numeric("(Intercept)", std::vector<double>(n, 1.0)));
    if (!added) return std::unexpected(added.error());
  }

  bool full_set_used = blueprint.intercept;
  for (const auto& term : terms) {
    const data::Column* column = data.find(term.column);
    if (!column) {
      return std::unexpected(WorkflowError::UnknownColumn);
    }

    data::Column encoded;
    if (term.transform == TermTransform::Log) {
      const auto* numeric = column->numeric();
      if (!numeric) {
        return std::unexpected(WorkflowError::InvalidColumn);
      }
      std::vector<double> values(numeric->values.size());
      std::transform(numeric->values.begin(), numeric->values.end(), values.begin(),
                     [](double v) { return std::log(v); });
      encoded = data::make_numeric(term.label(), std::move(values));
    } else if (column->numeric()) {
      if (ptype) {
        const data::Column* reference = ptype->find(term.column);
        if (reference && reference->is_factor()) {
          return std::unexpected(WorkflowError::InvalidColumn);
        }
      }
      encoded = *column;
    } else {
      data::FactorColumn factor = *column->factor();
      if (ptype) {
        const data::Column* reference = ptype->find(term.column);
        if (!reference || !reference->is_factor()) {
          return std::unexpected(WorkflowError::InvalidColumn);
        }
        auto conformed = conform_levels(*reference->factor(), factor,
                                        blueprint.allow_novel_levels);
        if (!conformed) return std::unexpected(conformed.error());
        factor = std::move(*conformed);
      }

      if (!blueprint.indicators) {
        encoded = data::Column{term.column, std::move(factor)};
      } else {
        // Without an intercept the first factor keeps all of its levels.
        const std::size_t first = full_set_used ? 1 : 0;
        full_set_used = true;
        for (std::size_t level = first; level < factor.levels.size(); ++level) {
          std::vector<double> dummy(n, 0.0);
          for (std::size_t row = 0; row < n; ++row) {
            if (factor.codes[row] == static_cast<std::int32_t>(level)) dummy[row] = 1.0;
          }
          auto added = out.add_column(
              data::make_numeric(term.column + factor.levels[level], std::move(dummy)));
          if (!added) return std::unexpected(added.error());
        }
        continue;
      }
    }

    auto added = out.add_column(std::move(encoded));
    if (!added) return std::unexpected(added.error());
  }
  return out;
}

}  // namespace

std::expected<Mold, WorkflowError> mold_formula(const Formula& formula,
                                                const FormulaBlueprint& blueprint,
                                                const data::Table& data) {
  auto terms = formula.resolve_predictors(data);
  if (!terms) {
    return std::unexpected(terms.error());
  }
  auto outcomes = data.select(formula.outcomes());
  if (!outcomes) {
    return std::unexpected(outcomes.error());
  }
  auto predictors = encode_terms(*terms, blueprint, data, nullptr);
  if (!predictors) {
    return std::unexpected(predictors.error());
  }

  std::vector<std::string> raw;
  for (const auto& term : *terms) {
    if (std::find(raw.begin(), raw.end(), term.column) == raw.end()) {
      raw.push_back(term.column);
    }
  }
  auto ptype = data.select(raw);
  if (!ptype) {
    return std::unexpected(ptype.error());
  }

  Mold mold;
  mold.predictors = std::move(*predictors);
  mold.outcomes = std::move(*outcomes);
  mold.blueprint = blueprint;
  mold.ptype = ptype->prototype();
  mold.terms = std::move(*terms);
  return mold;
}

std::expected<Mold, WorkflowError> mold_recipe(const Recipe& recipe,
                                               const RecipeBlueprint& blueprint,
                                               const data::Table& data) {
  auto prepped = prep(recipe, data);
  if (!prepped) {
    return std::unexpected(prepped.error());
  }
  auto baked = prepped->bake(data, true);
  if (!baked) {
    return std::unexpected(baked.error());
  }
  auto predictors = baked->select(prepped->predictors());
  if (!predictors) {
    return std::unexpected(predictors.error());
  }
  auto outcomes = baked->select(prepped->outcomes());
  if (!outcomes) {
    return std::unexpected(outcomes.error());
  }
  auto ptype = data.select(recipe.predictors());
  if (!ptype) {
    return std::unexpected(ptype.error());
  }

  Mold mold;
  mold.predictors = std::move(*predictors);
  mold.outcomes = std::move(*outcomes);
  mold.blueprint = blueprint;
  mold.ptype = ptype->prototype();
  mold.recipe = std::move(*prepped);
  return mold;
}

std::expected<data::Table, WorkflowError> forge(const Mold& mold,
                                                const data::Table& new_data) {
  return std::visit(
      core::Overloaded{
          [&](const FormulaBlueprint& bp) -> std::expected<data::Table, WorkflowError> {
            return encode_terms(mold.terms, bp, new_data, &mold.ptype);
          },
          [&](const RecipeBlueprint& bp) -> std::expected<data::Table, WorkflowError> {
            if (!mold.recipe) {
              return std::unexpected(WorkflowError::MoldNotPresent);
            }
            data::Table conformed;
            for (const auto& reference : mold.ptype.columns()) {
              const data::Column* column = new_data.find(reference.name);
              if (!column) {
                return std::unexpected(WorkflowError::UnknownColumn);
              }
              data::Column copy = *column;
              if (reference.is_factor()) {
                if (!column->is_factor()) {
                  return std::unexpected(WorkflowError::InvalidColumn);
                }
                auto levels = conform_levels(*reference.factor(), *column->factor(),
                                             bp.allow_novel_levels);
                if (!levels) return std::unexpected(levels.error());
                copy.data = std::move(*levels);
              }
              auto added = conformed.add_column(std::move(copy));
              if (!added) return std::unexpected(added.error());
            }
            auto baked = mold.recipe->bake(conformed, false);
            if (!baked) {
              return std::unexpected(baked.error());
            }
            return baked->select(mold.recipe->predictors());
          },
      },
      mold.blueprint);
}

}  // namespace modelflow::preprocess
